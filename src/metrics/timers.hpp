#pragma once
#include <chrono>
#include <string>

namespace csvsa {

struct WallTimer {
    using clock = std::chrono::steady_clock;
    clock::time_point t0, t1;
    void start() { t0 = clock::now(); }
    void stop()  { t1 = clock::now(); }
    double ms() const { return std::chrono::duration<double,std::milli>(t1 - t0).count(); }
};

struct StageTiming {
    std::string name;
    double      ms = 0.0;
};

struct StageTimer {
    std::string name;
    WallTimer   wt{};

    explicit StageTimer(const char* n) : name(n ? n : "(stage)") { wt.start(); }
    StageTiming stop() { wt.stop(); return StageTiming{ name, wt.ms() }; }
};

}
