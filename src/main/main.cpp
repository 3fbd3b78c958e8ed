#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "../cli/cli_options.hpp"
#include "../metrics/timers.hpp"
#include "../pipeline/pipeline.hpp"
#include "../report/emit_run_json.hpp"
#include "../util/errors.hpp"
#include "../util/log.hpp"

using namespace csvsa;

// exit codes
enum : int {
    exit_ok = 0,
    exit_bad_args = 1,
    exit_input = 2,
    exit_specification = 3,
    exit_internal = 4,
    exit_output = 5,
};

int main(int argc, char** argv) {
    AppOptions opt;
    try {
        opt = parse_cli(argc, argv);
    } catch (const cli_exit& e) {
        // --help / --version exit with 0, usage errors were already printed by CLI11
        return e.code == 0 ? exit_ok : exit_bad_args;
    }
    set_log_level(log_level_for(opt));

    try {
        WallTimer wt_all; wt_all.start();
        const auto started_iso = now_iso_utc();

        pipeline p(to_pipeline_config(opt));
        const pipeline_result& res = p.run();

        wt_all.stop();
        log_info("sampled and anonymized {} rows x {} columns; output saved to {}",
                 res.rows_out, res.columns_out, opt.output);

        if (!opt.run_summary.empty()) {
            RunInfo info;
            info.started_iso = started_iso;
            info.ended_iso = now_iso_utc();
            info.wall_ms = wt_all.ms();
            info.input_path = opt.input;
            info.output_path = opt.output;
            if (opt.has_seed) info.seed = opt.seed;
            emit_run_json(opt.run_summary, info, res);
            log_debug("run summary written to {}", opt.run_summary);
        }
        return exit_ok;
    }
    catch (const input_error& e)         { log_error("{}", e.what()); return exit_input; }
    catch (const specification_error& e) { log_error("{}", e.what()); return exit_specification; }
    catch (const output_error& e)        { log_error("{}", e.what()); return exit_output; }
    catch (const synthesis_error& e)     { log_error("{}", e.what()); return exit_internal; }
    catch (const std::exception& e) {
        log_error("unexpected failure: {}", e.what());
        return exit_internal;
    }
}
