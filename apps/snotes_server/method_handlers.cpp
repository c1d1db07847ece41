#include "method_handlers.h"

#include "handlers/cleanup_expired.h"
#include "handlers/create_paste.h"
#include "handlers/get_paste.h"
#include "handlers/health.h"

namespace snotes::server {

MethodRegistry build_method_registry() {
  MethodRegistry registry;
  registry["health"] = handlers::handle_health;
  registry["pastes.create"] = handlers::handle_create_paste;
  registry["pastes.get"] = handlers::handle_get_paste;
  registry["pastes.get_content"] = handlers::handle_get_paste_content;
  registry["pastes.cleanup_expired"] = handlers::handle_cleanup_expired;
  return registry;
}

}  // namespace snotes::server
