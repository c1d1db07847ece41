#include "health.h"

#include "snotes/core/time.h"
#include "snotes/core/version.h"

#include <string>
#include <utility>

namespace snotes::server::handlers {

using json = nlohmann::json;

HandlerResult handle_health(const json& /*params*/, ServerContext& ctx) {
  json result;
  result["status"] = "ok";
  result["version"] = core::kBuildVersion;
  result["storage"] = std::string(ctx.storage.backend_name());
  result["worker_id"] = ctx.config.worker_id;
  result["time"] = core::format_iso8601(ctx.clock.now());
  return HandlerResult::ok(std::move(result));
}

}  // namespace snotes::server::handlers
