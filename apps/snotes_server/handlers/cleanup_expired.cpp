#include "cleanup_expired.h"

#include "snotes/app/paste_service.h"

namespace snotes::server::handlers {

using json = nlohmann::json;

HandlerResult handle_cleanup_expired(const json& /*params*/, ServerContext& ctx) {
  const std::size_t removed = app::sweep_expired(ctx.storage);
  return HandlerResult::ok(json{{"removed", removed}});
}

}  // namespace snotes::server::handlers
