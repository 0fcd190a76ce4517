// src/sim/lua_runtime.cpp
#include "lua_runtime.hpp"
#include "utils/logging.hpp"

namespace sim {

LuaRuntime::~LuaRuntime() {
    close_();
}

void LuaRuntime::close_() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaRuntime::open_state_() {
    close_();
    L_ = luaL_newstate();
    if (!L_) return false;
    luaL_openlibs(L_);
    return true;
}

bool LuaRuntime::init(const std::string& lua_script_path, double nominal_frequency_hz) {
    fn_hz_ = nominal_frequency_hz;
    if (!open_state_()) return false;

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load script: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        close_();
        return false;
    }
    LOG_INFO("[Lua] Loaded frequency scenario: %s", lua_script_path.c_str());
    return call_init_();
}

bool LuaRuntime::init_from_string(const std::string& lua_source, double nominal_frequency_hz) {
    fn_hz_ = nominal_frequency_hz;
    if (!open_state_()) return false;

    if (luaL_dostring(L_, lua_source.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load chunk: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        close_();
        return false;
    }
    return call_init_();
}

bool LuaRuntime::call_init_() {
    lua_getglobal(L_, "frequency_at");
    const bool has_freq = lua_isfunction(L_, -1);
    lua_pop(L_, 1);
    if (!has_freq) {
        LOG_ERROR("[Lua] frequency_at() missing");
        close_();
        return false;
    }

    // Optional scenario_init(fn_hz)
    lua_getglobal(L_, "scenario_init");
    if (lua_isfunction(L_, -1)) {
        lua_pushnumber(L_, fn_hz_);
        if (lua_pcall(L_, 1, 1, 0) != LUA_OK) {
            LOG_ERROR("[Lua] scenario_init failed: %s", lua_tostring(L_, -1));
            lua_pop(L_, 1);
            close_();
            return false;
        }
        const bool ok = lua_toboolean(L_, -1);
        lua_pop(L_, 1);
        if (!ok) {
            LOG_WARN("[Lua] scenario_init returned false");
        }
    } else {
        lua_pop(L_, 1);
    }

    return true;
}

bool LuaRuntime::frequency_at(double t_s, double& out_hz) {
    if (!L_) return false;

    lua_getglobal(L_, "frequency_at");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        LOG_ERROR("[Lua] frequency_at() missing");
        return false;
    }

    lua_pushnumber(L_, t_s);
    lua_pushnumber(L_, fn_hz_);

    if (lua_pcall(L_, 2, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] frequency_at failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    if (!lua_isnumber(L_, -1)) {
        LOG_ERROR("[Lua] frequency_at(%.1f) did not return a number", t_s);
        lua_pop(L_, 1);
        return false;
    }

    out_hz = lua_tonumber(L_, -1);
    lua_pop(L_, 1);
    return true;
}

bool LuaRuntime::generate(const std::vector<double>& time_s, FrequencySeries& out) {
    out.time_s = time_s;
    out.frequency_hz.assign(time_s.size(), fn_hz_);

    for (size_t i = 0; i < time_s.size(); ++i) {
        if (!frequency_at(time_s[i], out.frequency_hz[i])) {
            LOG_ERROR("[Lua] Scenario aborted at sample %zu (t=%.1f s)", i, time_s[i]);
            return false;
        }
    }

    LOG_INFO("[Lua] Generated %zu frequency samples", time_s.size());
    return true;
}

} // namespace sim
