#include <spdlog/spdlog.h>
#include <titlebook/execution/context.hpp>
#include <utility>

namespace titlebook::execution {

context::context(encoder_t& encoder, const storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<titlebook::schema::bytes_t> context::get_state(
    std::string_view key) const {
  return storage_.get(titlebook::schema::make_bytes_view(key));
}

void context::put_state(std::string_view key,
                        titlebook::schema::bytes_t value) {
  spdlog::debug("Staging write '{}' ({} bytes)", key, value.size());
  writes_.emplace_back(titlebook::schema::make_bytes(key), std::move(value));
}

const std::vector<titlebook::storage::key_value_entry_t>& context::writes()
    const {
  return writes_;
}

encoder_t& context::encoder() const {
  return encoder_;
}

}  // namespace titlebook::execution
