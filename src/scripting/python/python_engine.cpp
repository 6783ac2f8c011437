/// @file python_engine.cpp
/// @brief pybind11 embedding, restricted builtins and the `editor` object.

#include "edext/script/python_engine.hpp"

#include "edext/foundation/engine_logger.hpp"

#include <pybind11/embed.h>
#include <pybind11/stl.h>

#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace py = pybind11;

using edext::foundation::EngineError;
using edext::foundation::EngineResult;
using edext::foundation::ErrorCode;
using edext::foundation::LogCategory;

namespace edext::script {

namespace {

constexpr const char* kTag = "[python] ";

/// Builtins left visible to scripts.
constexpr std::array kSafeBuiltins = {
    "abs", "all", "any", "ascii", "bin", "bool", "bytearray", "bytes", "callable", "chr",
    "dict", "divmod", "enumerate", "filter", "float", "format", "frozenset", "hasattr",
    "hash", "hex", "int", "isinstance", "issubclass", "iter", "len", "list", "map", "max",
    "min", "next", "oct", "ord", "pow", "range", "repr", "reversed", "round", "set",
    "slice", "sorted", "str", "sum", "tuple", "zip", "__build_class__",
    "ArithmeticError", "AttributeError", "Exception", "IndexError", "KeyError",
    "LookupError", "NameError", "NotImplementedError", "RuntimeError", "StopIteration",
    "TypeError", "ValueError", "ZeroDivisionError",
};

/// Unwrap a bridge result or raise RuntimeError inside the script.
template <typename T>
T unwrap(foundation::EngineResult<T> result) {
    if (!result) {
        throw std::runtime_error(std::string(result.error().message()));
    }
    return std::move(result).value();
}

void unwrap(foundation::EngineResult<void> result) {
    if (!result) {
        throw std::runtime_error(std::string(result.error().message()));
    }
}

/// Script-facing view of the capability bridge.
class EditorApi {
public:
    EditorApi(bridge::ICapabilityBridge* bridge, std::string notifyTitle)
        : bridge_(bridge), notifyTitle_(std::move(notifyTitle)) {}

    std::string getText() const { return unwrap(bridge_->GetText()); }
    void setText(const std::string& text) { unwrap(bridge_->SetText(text)); }
    std::string getSelection() const { return unwrap(bridge_->GetSelection()); }
    void replaceSelection(const std::string& text) { unwrap(bridge_->ReplaceSelection(text)); }
    void insertText(const std::string& text) { unwrap(bridge_->InsertText(text)); }

    std::pair<int, int> getCursor() const {
        auto pos = unwrap(bridge_->GetCursor());
        return {pos.line, pos.column};
    }

    void setCursor(int line, int column) { unwrap(bridge_->SetCursor({line, column})); }

    std::optional<std::string> getFilePath() const {
        auto path = bridge_->GetFilePath();
        if (!path) {
            if (path.error().code() == ErrorCode::NoFilePath) {
                return std::nullopt;
            }
            throw std::runtime_error(std::string(path.error().message()));
        }
        return path.value().string();
    }

    std::string getLanguage() const { return unwrap(bridge_->GetLanguage()); }

    void notify(const std::string& message, const std::optional<std::string>& title) {
        unwrap(bridge_->Notify(title.value_or(notifyTitle_), message));
    }

private:
    bridge::ICapabilityBridge* bridge_;
    std::string notifyTitle_;
};

/// Interpreter started on first use; finalized at process exit.
void ensureInterpreter() {
    static std::once_flag once;
    static std::unique_ptr<py::scoped_interpreter> interpreter;
    std::call_once(once, [] {
        if (!Py_IsInitialized()) {
            interpreter = std::make_unique<py::scoped_interpreter>();
        }
    });
}

EngineResult<void> scriptError(ErrorCode code, const std::string& message) {
    return EngineResult<void>::err(EngineError(code, kTag + message));
}

std::string firstLine(const std::string& text) {
    auto nl = text.find('\n');
    return nl == std::string::npos ? text : text.substr(0, nl);
}

bool isDunder(const std::string& name) {
    return name.size() > 4 && name.rfind("__", 0) == 0 &&
           name.compare(name.size() - 2, 2, "__") == 0;
}

/// Reject import statements and dunder names/attributes.
/// @return An error message, or an empty string when the tree is allowed.
std::string checkSyntaxTree(const py::module_& ast, const py::object& tree) {
    py::object importNode = ast.attr("Import");
    py::object importFromNode = ast.attr("ImportFrom");
    py::object attributeNode = ast.attr("Attribute");
    py::object nameNode = ast.attr("Name");

    for (py::handle node : ast.attr("walk")(tree)) {
        auto line = [&] {
            return py::hasattr(node, "lineno") ? std::to_string(node.attr("lineno").cast<int>())
                                               : std::string("?");
        };
        if (py::isinstance(node, importNode) || py::isinstance(node, importFromNode)) {
            return "import statements are not allowed (line " + line() + ")";
        }
        if (py::isinstance(node, attributeNode)) {
            auto attr = node.attr("attr").cast<std::string>();
            if (isDunder(attr)) {
                return "access to attribute '" + attr + "' is not allowed (line " + line() + ")";
            }
        }
        if (py::isinstance(node, nameNode)) {
            auto id = node.attr("id").cast<std::string>();
            if (isDunder(id)) {
                return "use of name '" + id + "' is not allowed (line " + line() + ")";
            }
        }
    }
    return {};
}

py::dict restrictedBuiltins() {
    py::module_ builtins = py::module_::import("builtins");
    py::dict safe;
    for (const char* name : kSafeBuiltins) {
        if (py::hasattr(builtins, name)) {
            safe[name] = builtins.attr(name);
        }
    }
    safe["print"] = py::cpp_function([](py::args args) {
        std::string line;
        for (std::size_t i = 0; i < args.size(); ++i) {
            if (i > 0) {
                line += ' ';
            }
            line += py::str(args[i]).cast<std::string>();
        }
        EDEXT_LOG_INFO(LogCategory::Script, kTag + line);
    });
    return safe;
}

} // namespace

} // namespace edext::script

PYBIND11_EMBEDDED_MODULE(edext_editor, m) {
    using edext::script::EditorApi;
    py::class_<EditorApi>(m, "Editor")
        .def("get_text", &EditorApi::getText)
        .def("set_text", &EditorApi::setText, py::arg("text"))
        .def("get_selection", &EditorApi::getSelection)
        .def("replace_selection", &EditorApi::replaceSelection, py::arg("text"))
        .def("insert_text", &EditorApi::insertText, py::arg("text"))
        .def("get_cursor", &EditorApi::getCursor)
        .def("set_cursor", &EditorApi::setCursor, py::arg("line"), py::arg("column"))
        .def("get_file_path", &EditorApi::getFilePath)
        .def("get_language", &EditorApi::getLanguage)
        .def("notify", &EditorApi::notify, py::arg("message"), py::arg("title") = py::none());
}

namespace edext::script {

EngineResult<void> PythonEngine::Run(const ScriptSource& source, std::string_view entryPoint,
                                     bridge::ICapabilityBridge& bridge) {
    ensureInterpreter();
    py::gil_scoped_acquire gil;

    try {
        py::module_ ast = py::module_::import("ast");
        py::object tree = ast.attr("parse")(source.code, source.name, "exec");

        if (auto violation = checkSyntaxTree(ast, tree); !violation.empty()) {
            return scriptError(ErrorCode::SandboxViolation, violation);
        }

        py::module_::import("edext_editor");
        py::module_ builtins = py::module_::import("builtins");

        py::dict globals;
        globals["__builtins__"] = restrictedBuiltins();
        globals["__name__"] = "__edext_script__";
        globals["editor"] = py::cast(EditorApi(&bridge, source.notifyTitle));

        py::object code = builtins.attr("compile")(tree, source.name, "exec");
        builtins.attr("exec")(code, globals);

        std::string entry(entryPoint);
        py::object fn = globals.contains(entry) ? py::object(globals[py::str(entry)]) : py::none();
        if (!py::isinstance<py::function>(fn)) {
            return scriptError(ErrorCode::EntryPointNotFound,
                               "entry point '" + entry + "' is not defined in " + source.name);
        }
        fn();
    } catch (py::error_already_set& e) {
        std::string message = firstLine(e.what());
        EDEXT_LOG_DEBUG(LogCategory::Script, kTag + std::string(e.what()));
        if (e.matches(PyExc_SyntaxError)) {
            return scriptError(ErrorCode::ScriptSyntaxError, message);
        }
        return scriptError(ErrorCode::ScriptRuntimeError, message);
    } catch (const std::exception& e) {
        return scriptError(ErrorCode::ScriptRuntimeError, e.what());
    }
    return EngineResult<void>::ok();
}

} // namespace edext::script
