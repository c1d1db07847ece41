#include "paste_logic.h"

#include "snotes/domain/paste.h"
#include "snotes/token/snowflake_generator.h"

#include <nlohmann/json.hpp>

#include <string>

std::string check_put_worker_id(const std::optional<int>& worker_id) {
  if (!worker_id.has_value()) {
    return "--worker-id <0-1023> is required and must differ from the server's --worker-id";
  }
  if (*worker_id < 0 || *worker_id > snotes::token::SnowflakeGenerator::kMaxWorkerId) {
    return "--worker-id " + std::to_string(*worker_id) + " is out of range (0-1023)";
  }
  return "";
}

int execute_put(const snotes::app::CreatePasteRequest& request,
                snotes::storage::IPasteStorage& storage, std::ostream& out, std::ostream& err) {
  auto created = snotes::app::create_paste(request, storage);
  if (!created.has_value()) {
    err << "Rejected " << created.error().field << ": " << created.error().message << "\n";
    return 1;
  }

  out << snotes::domain::paste_metadata_to_json(created.value()).dump(2) << "\n";
  return 0;
}

int execute_get(const std::string& token, snotes::storage::IPasteStorage& storage,
                std::ostream& out, std::ostream& err) {
  auto paste = snotes::app::fetch_paste(token, storage);
  if (!paste.has_value()) {
    err << paste.error().message << ": " << token << "\n";
    return 1;
  }

  out << snotes::domain::paste_to_json(paste.value()).dump(2) << "\n";
  return 0;
}

int execute_sweep(snotes::storage::IPasteStorage& storage, std::ostream& out) {
  const std::size_t removed = snotes::app::sweep_expired(storage);
  out << nlohmann::json{{"removed", removed}}.dump() << "\n";
  return 0;
}
