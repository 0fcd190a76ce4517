// src/sim/lua_runtime.hpp
#pragma once

#include <string>
#include <vector>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "sim/frequency_source.hpp"

namespace sim {

/**
 * LuaRuntime - Scripted frequency scenarios
 *
 * The script must define
 *     function frequency_at(t_s, fn_hz) return <Hz> end
 * and may define
 *     function scenario_init(fn_hz) return true end
 */
class LuaRuntime {
public:
    LuaRuntime() = default;
    ~LuaRuntime();

    LuaRuntime(const LuaRuntime&) = delete;
    LuaRuntime& operator=(const LuaRuntime&) = delete;

    bool init(const std::string& lua_script_path, double nominal_frequency_hz);

    // Load a script from a string (tests, embedded scenarios)
    bool init_from_string(const std::string& lua_source, double nominal_frequency_hz);

    bool frequency_at(double t_s, double& out_hz);

    // Evaluate frequency_at() on every time stamp
    bool generate(const std::vector<double>& time_s, FrequencySeries& out);

    bool ready() const { return L_ != nullptr; }

private:
    lua_State* L_{nullptr};
    double fn_hz_{60.0};

    bool open_state_();
    bool call_init_();
    void close_();
};

} // namespace sim
