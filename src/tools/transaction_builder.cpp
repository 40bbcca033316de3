#include <boost/program_options.hpp>
#include <provenance/blake3/hash.hpp>
#include <provenance/common/critical.hpp>
#include <provenance/crypto/sign.hpp>
#include <provenance/execution/signing.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/event_filter.hpp>
#include <provenance/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = provenance::schema::encoding::encoder<
    provenance::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string require_string(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    std::cerr << "missing required argument --" << name << '\n';
    provenance::common::critical("missing required argument");
  }
  return vm[name].as<std::string>();
}

std::string optional_string(const po::variables_map& vm,
                            const std::string& name) {
  return vm.contains(name) ? vm[name].as<std::string>() : std::string{};
}

std::vector<std::string> string_list(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

provenance::schema::ed25519_signer_id parse_ed25519_key(
    const std::string& hex) {
  auto bytes = provenance::schema::from_hex(hex);
  auto signer = provenance::schema::ed25519_signer_id{};
  if (bytes.size() != signer.public_key.size()) {
    provenance::common::critical("ed25519 public key must be 32 bytes");
  }
  std::copy(std::begin(bytes), std::end(bytes),
            std::begin(signer.public_key));
  return signer;
}

provenance::schema::signer_id_t get_identity(const po::variables_map& vm,
                                             const std::string& name) {
  return provenance::schema::signer_id_t{
      parse_ed25519_key(require_string(vm, name))};
}

std::optional<provenance::schema::hash32_t> get_optional_hash32(
    const po::variables_map& vm,
    const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return provenance::schema::make_hash32(vm[name].as<std::string>());
}

std::optional<uint64_t> optional_u64(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<uint64_t>();
}

std::optional<std::string> optional_text(const po::variables_map& vm,
                                         const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<std::string>();
}

bool require_flag(const po::variables_map& vm, const std::string& name) {
  auto value = require_string(vm, name);
  if (value == "true") {
    return true;
  }
  if (value != "false") {
    provenance::common::critical("flag must be true or false", name);
  }
  return false;
}

// Custom fields are written KEY=VALUE; the value may contain '='.
provenance::schema::custom_field_t parse_custom_field(const std::string& entry) {
  auto split = entry.find('=');
  if (split == std::string::npos) {
    provenance::common::critical("custom field must be KEY=VALUE", entry);
  }
  return provenance::schema::custom_field_t{
      .key = entry.substr(0, split), .value = entry.substr(split + 1)};
}

provenance::crypto::ed25519_keypair get_keypair(const po::variables_map& vm) {
  auto seed_bytes = provenance::schema::from_hex(require_string(vm, "seed"));
  auto seed = provenance::crypto::ed25519_seed_t{};
  if (seed_bytes.size() != seed.size()) {
    provenance::common::critical("ed25519 seed must be 32 bytes");
  }
  std::copy(std::begin(seed_bytes), std::end(seed_bytes), std::begin(seed));
  auto keypair = provenance::crypto::make_ed25519_keypair(seed);
  if (!keypair) {
    provenance::common::critical("failed to derive ed25519 key");
  }
  return keypair.value();
}

provenance::schema::event_input_t make_event_input(
    std::string event_type,
    std::string location,
    const po::variables_map& vm) {
  auto event = provenance::schema::event_input_t{};
  event.event_type = std::move(event_type);
  event.location = std::move(location);
  event.metadata = provenance::schema::from_hex(optional_string(vm, "metadata"));
  event.data_hash = get_optional_hash32(vm, "data-hash");
  return event;
}

// Batch entries are written TYPE@LOCATION; the location may be empty.
provenance::schema::event_input_t parse_batch_event(
    const std::string& entry,
    const po::variables_map& vm) {
  auto split = entry.find('@');
  if (split == std::string::npos) {
    return make_event_input(entry, {}, vm);
  }
  return make_event_input(entry.substr(0, split), entry.substr(split + 1), vm);
}

provenance::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = require_string(vm, "payload");
  if (payload == "register_product") {
    auto op = provenance::schema::register_product_t{};
    op.product_id = require_string(vm, "product-id");
    op.name = require_string(vm, "name");
    op.origin = require_string(vm, "origin");
    op.description = optional_string(vm, "description");
    op.category = require_string(vm, "category");
    op.tags = string_list(vm, "tag");
    for (const auto& certification : string_list(vm, "certification")) {
      op.certifications.push_back(provenance::schema::make_hash32(certification));
    }
    for (const auto& media : string_list(vm, "media-hash")) {
      op.media_hashes.push_back(provenance::schema::make_hash32(media));
    }
    for (const auto& entry : string_list(vm, "custom")) {
      op.custom.push_back(parse_custom_field(entry));
    }
    return op;
  }
  if (payload == "add_tracking_event") {
    auto op = provenance::schema::add_tracking_event_t{};
    op.product_id = require_string(vm, "product-id");
    op.event = make_event_input(require_string(vm, "event-type"),
                                optional_string(vm, "location"), vm);
    return op;
  }
  if (payload == "add_tracking_events_batch") {
    auto op = provenance::schema::add_tracking_events_batch_t{};
    op.product_id = require_string(vm, "product-id");
    for (const auto& entry : string_list(vm, "batch-event")) {
      op.events.push_back(parse_batch_event(entry, vm));
    }
    return op;
  }
  if (payload == "transfer_ownership") {
    auto op = provenance::schema::transfer_ownership_t{};
    op.product_id = require_string(vm, "product-id");
    op.new_owner = get_identity(vm, "new-owner");
    return op;
  }
  if (payload == "add_authorized_actor") {
    auto op = provenance::schema::add_authorized_actor_t{};
    op.product_id = require_string(vm, "product-id");
    op.actor = get_identity(vm, "actor");
    return op;
  }
  if (payload == "remove_authorized_actor") {
    auto op = provenance::schema::remove_authorized_actor_t{};
    op.product_id = require_string(vm, "product-id");
    op.actor = get_identity(vm, "actor");
    return op;
  }
  if (payload == "register_event_type") {
    auto op = provenance::schema::register_event_type_t{};
    op.event_type = require_string(vm, "event-type");
    op.label = require_string(vm, "label");
    return op;
  }
  if (payload == "set_product_active") {
    auto op = provenance::schema::set_product_active_t{};
    op.product_id = require_string(vm, "product-id");
    op.active = require_flag(vm, "active");
    return op;
  }
  provenance::common::critical("unsupported payload type");
}

provenance::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = require_string(vm, "path");
  if (path == "/engine/info") {
    return {};
  }
  if (path == "/state/product") {
    return encoder.encode(require_string(vm, "product-id"));
  }
  if (path == "/state/events" || path == "/state/governance") {
    return encoder.encode(std::tuple{require_string(vm, "product-id"),
                                     vm["from"].as<uint64_t>(),
                                     optional_u64(vm, "limit")});
  }
  if (path == "/state/events/by_type") {
    return encoder.encode(std::tuple{
        require_string(vm, "product-id"), require_string(vm, "event-type"),
        vm["from"].as<uint64_t>(), optional_u64(vm, "limit")});
  }
  if (path == "/state/events/filter") {
    auto filter = provenance::schema::event_filter_t{};
    filter.event_type = optional_text(vm, "event-type");
    filter.start_time = optional_u64(vm, "start-time");
    filter.end_time = optional_u64(vm, "end-time");
    filter.location = optional_text(vm, "location");
    return encoder.encode(std::tuple{require_string(vm, "product-id"), filter,
                                     vm["from"].as<uint64_t>(),
                                     optional_u64(vm, "limit")});
  }
  if (path == "/state/event_count") {
    return encoder.encode(std::tuple{require_string(vm, "product-id"),
                                     optional_text(vm, "event-type")});
  }
  if (path == "/state/event") {
    return encoder.encode(std::tuple{require_string(vm, "product-id"),
                                     vm["from"].as<uint64_t>()});
  }
  if (path == "/state/authorized") {
    return encoder.encode(std::tuple{require_string(vm, "product-id"),
                                     get_identity(vm, "actor")});
  }
  if (path == "/state/event_type") {
    return encoder.encode(require_string(vm, "event-type"));
  }
  if (path == "/state/nonce") {
    return encoder.encode(get_identity(vm, "actor"));
  }
  if (path == "/history/range") {
    return encoder.encode(std::tuple{vm["from-height"].as<uint64_t>(),
                                     vm["to-height"].as<uint64_t>()});
  }
  provenance::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder keygen\n"
            << "  transaction_builder transaction --payload TYPE --seed HEX "
               "[options]\n"
            << "  transaction_builder query-key --path PATH [options]\n"
            << "  transaction_builder chain-id [--chain-id NAME]\n\n"
            << "Output is hex.\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|transaction|query-key|chain-id")(
      "payload", po::value<std::string>(),
      "register_product|add_tracking_event|add_tracking_events_batch|"
      "transfer_ownership|add_authorized_actor|remove_authorized_actor|"
      "register_event_type|set_product_active")("path", po::value<std::string>(), "query path")(
      "chain-id", po::value<std::string>()->default_value("provenance-local"),
      "network name")("nonce", po::value<uint64_t>()->default_value(1),
                      "transaction nonce")(
      "seed", po::value<std::string>(), "ed25519 seed hex of the signer")(
      "product-id", po::value<std::string>(), "product id")(
      "name", po::value<std::string>(), "product name")(
      "origin", po::value<std::string>(), "product origin")(
      "description", po::value<std::string>(), "product description")(
      "category", po::value<std::string>(), "product category")(
      "tag", po::value<std::vector<std::string>>()->multitoken(),
      "product tags")(
      "certification", po::value<std::vector<std::string>>()->multitoken(),
      "certificate document hash32 hex values")(
      "media-hash", po::value<std::vector<std::string>>()->multitoken(),
      "media hash32 hex values")(
      "custom", po::value<std::vector<std::string>>()->multitoken(),
      "custom fields as KEY=VALUE")(
      "active", po::value<std::string>(), "product status, true or false")(
      "event-type", po::value<std::string>(), "event type tag")(
      "location", po::value<std::string>(), "event location")(
      "metadata", po::value<std::string>(), "event metadata hex")(
      "data-hash", po::value<std::string>(), "event document hash32 hex")(
      "batch-event", po::value<std::vector<std::string>>()->multitoken(),
      "batch entries as TYPE@LOCATION")(
      "new-owner", po::value<std::string>(), "ed25519 public key hex")(
      "actor", po::value<std::string>(), "ed25519 public key hex")(
      "label", po::value<std::string>(), "event type display label")(
      "from", po::value<uint64_t>()->default_value(0), "first sequence")(
      "limit", po::value<uint64_t>(), "maximum records")(
      "start-time", po::value<uint64_t>(), "filter window start, unix ms")(
      "end-time", po::value<uint64_t>(), "filter window end, unix ms")(
      "from-height", po::value<uint64_t>()->default_value(1),
      "history range from")(
      "to-height", po::value<uint64_t>()->default_value(1), "history range to");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto encoder = encoder_t{};
  auto chain_id = provenance::blake3::hash(
      std::string_view{vm["chain-id"].as<std::string>()});

  if (command == "keygen") {
    auto keypair = provenance::crypto::generate_ed25519_keypair();
    if (!keypair) {
      provenance::common::critical("failed to generate ed25519 key");
    }
    std::cout << "seed " << provenance::schema::to_hex(keypair->seed) << '\n'
              << "public_key "
              << provenance::schema::to_hex(keypair->signer.public_key)
              << '\n';
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto keypair = get_keypair(vm);
    auto transaction = provenance::schema::transaction_t{
        .version = 1,
        .chain_id = chain_id,
        .nonce = vm["nonce"].as<uint64_t>(),
        .signer = provenance::schema::signer_id_t{keypair.signer},
        .payload = build_payload(vm),
        .signature = provenance::schema::ed25519_signature_t{}};
    auto message =
        provenance::execution::make_signing_message(encoder, transaction);
    auto signature = provenance::crypto::sign_ed25519(
        keypair, provenance::schema::make_bytes_view(message));
    if (!signature) {
      provenance::common::critical("failed to sign transaction");
    }
    transaction.signature = signature.value();
    std::cout << provenance::schema::to_hex(encoder.encode(transaction))
              << '\n';
    return 0;
  }

  if (command == "query-key") {
    auto key = build_query_key(vm);
    std::cout << provenance::schema::to_hex(key) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << provenance::schema::to_hex(chain_id) << '\n';
    return 0;
  }

  provenance::common::critical(
      "command must be keygen|transaction|query-key|chain-id");
}
