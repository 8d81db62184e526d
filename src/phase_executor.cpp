#include "phase_executor.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"

#include <chrono>

namespace strata {

phase_executor::phase_executor(phase_table const &table) : table_{ table } {}

void phase_executor::execute(std::string_view phase, build_context &ctx) const {
  std::string const phase_name{ phase };

  phase_fn const *impl{ table_.find(phase) };
  if (!impl) { throw unknown_phase_error{ table_.level(), phase_name }; }

  phase_trace_scope trace_scope{ ctx.package(),
                                 table_.level(),
                                 phase_name,
                                 std::chrono::steady_clock::now() };
  tui::debug("[%s] phase %s (API level %s) in %s",
             ctx.package().c_str(),
             phase_name.c_str(),
             table_.level().c_str(),
             ctx.workdir().c_str());

  try {
    (*impl)(ctx);
  } catch (step_failed_error const &e) {
    STRATA_TRACE_STEP_FAILED(ctx.package(),
                             phase_name,
                             std::string{ build_step_name(e.step()) },
                             e.result().exit_code);
    tui::error("[%s] %s aborted in %s step: %s",
               ctx.package().c_str(),
               phase_name.c_str(),
               std::string{ build_step_name(e.step()) }.c_str(),
               e.what());
    throw;
  } catch (build_abort_error const &e) {
    tui::error("[%s] %s aborted: %s", ctx.package().c_str(), phase_name.c_str(), e.what());
    throw;
  }

  trace_scope.mark_ok();
  tui::debug("[%s] phase %s complete", ctx.package().c_str(), phase_name.c_str());
}

void phase_executor::execute_all(std::vector<std::string> const &phases,
                                 build_context &ctx) const {
  for (auto const &phase : phases) {
    if (!table_.contains(phase)) { throw unknown_phase_error{ table_.level(), phase }; }
  }
  for (auto const &phase : phases) { execute(phase, ctx); }
}

}  // namespace strata
