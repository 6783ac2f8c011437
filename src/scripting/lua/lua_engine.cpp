/// @file lua_engine.cpp
/// @brief Lua 5.4 sandbox and `editor` bindings.

#include "edext/script/lua_engine.hpp"

#include "edext/foundation/engine_logger.hpp"

#include <limits>
#include <memory>
#include <string>

extern "C" {
#include <lauxlib.h>
#include <lua.h>
#include <lualib.h>
}

using edext::foundation::EngineError;
using edext::foundation::EngineResult;
using edext::foundation::ErrorCode;
using edext::foundation::LogCategory;

namespace edext::script {

namespace {

constexpr const char* kTag = "[lua] ";

/// Per-run data reachable from the `editor` functions through an upvalue.
struct LuaBinding {
    bridge::ICapabilityBridge* bridge = nullptr;
    std::string notifyTitle;
};

struct StateDeleter {
    void operator()(lua_State* L) const noexcept { lua_close(L); }
};
using StatePtr = std::unique_ptr<lua_State, StateDeleter>;

std::string toString(lua_State* L, int idx) {
    std::size_t len = 0;
    const char* s = lua_tolstring(L, idx, &len);
    return s != nullptr ? std::string(s, len) : std::string();
}

LuaBinding& binding(lua_State* L) {
    return *static_cast<LuaBinding*>(lua_touserdata(L, lua_upvalueindex(1)));
}

/// Index of the first real argument; skips `self` for colon calls.
int firstArg(lua_State* L) {
    return lua_istable(L, 1) ? 2 : 1;
}

// Bindings never raise while C++ objects are alive on their frame: each
// body returns the number of results, or -1 after pushing an error message,
// and the wrapper raises the Lua error.
using Body = int (*)(lua_State* L, LuaBinding& b);

template <Body F>
int guarded(lua_State* L) {
    int n = F(L, binding(L));
    if (n < 0) {
        return lua_error(L);
    }
    return n;
}

int pushError(lua_State* L, const EngineError& error) {
    lua_pushlstring(L, error.message().data(), error.message().size());
    return -1;
}

int pushString(lua_State* L, const std::string& s) {
    lua_pushlstring(L, s.data(), s.size());
    return 1;
}

/// Checked string argument; pushes a message and returns false on mismatch.
bool stringArg(lua_State* L, int idx, const char* fn, std::string& out) {
    if (lua_type(L, idx) != LUA_TSTRING && lua_type(L, idx) != LUA_TNUMBER) {
        lua_pushfstring(L, "editor.%s: expected string argument", fn);
        return false;
    }
    out = toString(L, idx);
    return true;
}

int getText(lua_State* L, LuaBinding& b) {
    auto r = b.bridge->GetText();
    return r ? pushString(L, r.value()) : pushError(L, r.error());
}

int setText(lua_State* L, LuaBinding& b) {
    std::string text;
    if (!stringArg(L, firstArg(L), "set_text", text)) {
        return -1;
    }
    auto r = b.bridge->SetText(text);
    return r ? 0 : pushError(L, r.error());
}

int getSelection(lua_State* L, LuaBinding& b) {
    auto r = b.bridge->GetSelection();
    return r ? pushString(L, r.value()) : pushError(L, r.error());
}

int replaceSelection(lua_State* L, LuaBinding& b) {
    std::string text;
    if (!stringArg(L, firstArg(L), "replace_selection", text)) {
        return -1;
    }
    auto r = b.bridge->ReplaceSelection(text);
    return r ? 0 : pushError(L, r.error());
}

int insertText(lua_State* L, LuaBinding& b) {
    std::string text;
    if (!stringArg(L, firstArg(L), "insert_text", text)) {
        return -1;
    }
    auto r = b.bridge->InsertText(text);
    return r ? 0 : pushError(L, r.error());
}

int getCursor(lua_State* L, LuaBinding& b) {
    auto r = b.bridge->GetCursor();
    if (!r) {
        return pushError(L, r.error());
    }
    lua_pushinteger(L, r.value().line);
    lua_pushinteger(L, r.value().column);
    return 2;
}

int setCursor(lua_State* L, LuaBinding& b) {
    int base = firstArg(L);
    int isLine = 0;
    int isColumn = 0;
    lua_Integer line = lua_tointegerx(L, base, &isLine);
    lua_Integer column = lua_tointegerx(L, base + 1, &isColumn);
    if (isLine == 0 || isColumn == 0) {
        lua_pushliteral(L, "editor.set_cursor: expected integer line and column");
        return -1;
    }
    constexpr lua_Integer kMax = std::numeric_limits<int>::max();
    if (line < 1 || line > kMax || column < 1 || column > kMax) {
        lua_pushliteral(L, "editor.set_cursor: line and column out of range");
        return -1;
    }
    auto r = b.bridge->SetCursor({static_cast<int>(line), static_cast<int>(column)});
    return r ? 0 : pushError(L, r.error());
}

int getFilePath(lua_State* L, LuaBinding& b) {
    auto r = b.bridge->GetFilePath();
    if (!r) {
        if (r.error().code() == ErrorCode::NoFilePath) {
            lua_pushnil(L);
            return 1;
        }
        return pushError(L, r.error());
    }
    return pushString(L, r.value().string());
}

int getLanguage(lua_State* L, LuaBinding& b) {
    auto r = b.bridge->GetLanguage();
    return r ? pushString(L, r.value()) : pushError(L, r.error());
}

int notify(lua_State* L, LuaBinding& b) {
    int base = firstArg(L);
    std::string message;
    if (!stringArg(L, base, "notify", message)) {
        return -1;
    }
    std::string title = b.notifyTitle;
    if (!lua_isnoneornil(L, base + 1) && !stringArg(L, base + 1, "notify", title)) {
        return -1;
    }
    auto r = b.bridge->Notify(title, message);
    return r ? 0 : pushError(L, r.error());
}

/// `print` replacement. The line is joined in a luaL_Buffer so a raising
/// `__tostring` unwinds before any C++ object exists on this frame.
int logPrint(lua_State* L) {
    int n = lua_gettop(L);
    luaL_Buffer buf;
    luaL_buffinit(L, &buf);
    for (int i = 1; i <= n; ++i) {
        if (i > 1) {
            luaL_addchar(&buf, '\t');
        }
        luaL_tolstring(L, i, nullptr);
        luaL_addvalue(&buf);
    }
    luaL_pushresult(&buf);
    EDEXT_LOG_INFO(LogCategory::Script, kTag + toString(L, -1));
    return 0;
}

const luaL_Reg kEditorFunctions[] = {
    {"get_text", guarded<getText>},
    {"set_text", guarded<setText>},
    {"get_selection", guarded<getSelection>},
    {"replace_selection", guarded<replaceSelection>},
    {"insert_text", guarded<insertText>},
    {"get_cursor", guarded<getCursor>},
    {"set_cursor", guarded<setCursor>},
    {"get_file_path", guarded<getFilePath>},
    {"get_language", guarded<getLanguage>},
    {"notify", guarded<notify>},
    {nullptr, nullptr},
};

constexpr const char* kRemovedGlobals[] = {
    "dofile", "loadfile", "load", "loadstring", "require", "collectgarbage",
};

/// Open the permitted libraries and strip the base library.
void openSandbox(lua_State* L) {
    luaL_requiref(L, LUA_GNAME, luaopen_base, 1);
    luaL_requiref(L, LUA_STRLIBNAME, luaopen_string, 1);
    luaL_requiref(L, LUA_TABLIBNAME, luaopen_table, 1);
    luaL_requiref(L, LUA_MATHLIBNAME, luaopen_math, 1);
    luaL_requiref(L, LUA_UTF8LIBNAME, luaopen_utf8, 1);
    lua_pop(L, 5);

    for (const char* name : kRemovedGlobals) {
        lua_pushnil(L);
        lua_setglobal(L, name);
    }
}

/// Install `editor` bound to @p b, and the logging `print`.
void installBindings(lua_State* L, LuaBinding& b) {
    lua_newtable(L);
    lua_pushlightuserdata(L, &b);
    luaL_setfuncs(L, kEditorFunctions, 1);
    lua_setglobal(L, "editor");

    lua_pushcfunction(L, logPrint);
    lua_setglobal(L, "print");
}

int traceback(lua_State* L) {
    const char* msg = lua_tostring(L, 1);
    if (msg == nullptr) {
        msg = luaL_typename(L, 1);
    }
    luaL_traceback(L, L, msg, 1);
    return 1;
}

/// lua_pcall with a traceback handler. On failure @p message gets the error
/// line and @p trace the full traceback.
bool protectedCall(lua_State* L, int nargs, std::string& message, std::string& trace) {
    int base = lua_gettop(L) - nargs;
    lua_pushcfunction(L, traceback);
    lua_insert(L, base);
    int status = lua_pcall(L, nargs, 0, base);
    lua_remove(L, base);
    if (status == LUA_OK) {
        return true;
    }
    trace = toString(L, -1);
    lua_pop(L, 1);
    auto nl = trace.find('\n');
    message = nl == std::string::npos ? trace : trace.substr(0, nl);
    return false;
}

EngineResult<void> scriptError(ErrorCode code, const std::string& message) {
    return EngineResult<void>::err(EngineError(code, kTag + message));
}

} // namespace

EngineResult<void> LuaEngine::Run(const ScriptSource& source, std::string_view entryPoint,
                                  bridge::ICapabilityBridge& bridge) {
    StatePtr state(luaL_newstate());
    if (!state) {
        return scriptError(ErrorCode::ScriptLoadFailed, "cannot create interpreter state");
    }
    lua_State* L = state.get();

    LuaBinding b{&bridge, source.notifyTitle};
    openSandbox(L);
    installBindings(L, b);

    std::string chunkName = "=" + source.name;
    // Text chunks only: precompiled bytecode is not verified by the VM.
    if (luaL_loadbufferx(L, source.code.data(), source.code.size(), chunkName.c_str(), "t") !=
        LUA_OK) {
        std::string message = toString(L, -1);
        return scriptError(ErrorCode::ScriptSyntaxError, message);
    }

    std::string message;
    std::string trace;
    if (!protectedCall(L, 0, message, trace)) {
        EDEXT_LOG_DEBUG(LogCategory::Script, kTag + trace);
        return scriptError(ErrorCode::ScriptRuntimeError, message);
    }

    std::string entry(entryPoint);
    if (lua_getglobal(L, entry.c_str()) != LUA_TFUNCTION) {
        return scriptError(ErrorCode::EntryPointNotFound,
                           "entry point '" + entry + "' is not defined in " + source.name);
    }
    if (!protectedCall(L, 0, message, trace)) {
        EDEXT_LOG_DEBUG(LogCategory::Script, kTag + trace);
        return scriptError(ErrorCode::ScriptRuntimeError, message);
    }
    return EngineResult<void>::ok();
}

} // namespace edext::script
