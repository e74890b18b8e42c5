#include <boost/program_options.hpp>
#include <ballot/blake3/hash.hpp>
#include <ballot/common/critical.hpp>
#include <ballot/schema/encoding/scale/encoder.hpp>
#include <ballot/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t =
    ballot::schema::encoding::encoder<ballot::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

constexpr auto kDefaultChainName = std::string_view{"ballot-local"};

std::string format_bytes(const po::variables_map& vm,
                         const ballot::schema::bytes_t& bytes) {
  auto format = vm["format"].as<std::string>();
  if (format == "base64") {
    return ballot::schema::to_base64(bytes);
  }
  if (format == "hex") {
    return ballot::schema::to_hex(ballot::schema::make_bytes_view(bytes));
  }
  ballot::common::critical("--format must be hex or base64");
}

ballot::schema::address_t get_address(const po::variables_map& vm,
                                      const std::string& name) {
  if (!vm.contains(name)) {
    std::cerr << "missing required --" << name << '\n';
    ballot::common::critical("missing required address argument");
  }
  auto address = ballot::schema::try_make_address_from_hex(
      std::string_view{vm[name].as<std::string>()});
  if (!address) {
    std::cerr << "--" << name << " must be 40 hex digits\n";
    ballot::common::critical("invalid address argument");
  }
  return *address;
}

std::string get_text(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    std::cerr << "missing required --" << name << '\n';
    ballot::common::critical("missing required text argument");
  }
  return vm[name].as<std::string>();
}

uint64_t get_proposal_id(const po::variables_map& vm) {
  if (!vm.contains("proposal-id")) {
    std::cerr << "missing required --proposal-id\n";
    ballot::common::critical("missing required proposal id");
  }
  return vm["proposal-id"].as<uint64_t>();
}

// An explicit --chain-id wins over hashing --chain-name.
ballot::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (vm.contains("chain-id")) {
    auto chain_id =
        ballot::schema::try_make_hash32(vm["chain-id"].as<std::string>());
    if (!chain_id) {
      std::cerr << "--chain-id must be 64 hex digits\n";
      ballot::common::critical("invalid chain id argument");
    }
    return *chain_id;
  }
  return ballot::blake3::hash(
      std::string_view{vm["chain-name"].as<std::string>()});
}

ballot::schema::transaction_payload_t build_payload(const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "create_proposal") {
    return ballot::schema::create_proposal_t{
        .title = get_text(vm, "title"),
        .description = get_text(vm, "description")};
  }
  if (payload == "cast_vote") {
    auto support = vm["support"].as<std::string>();
    if (support != "yes" && support != "no") {
      ballot::common::critical("--support must be yes or no");
    }
    return ballot::schema::cast_vote_t{.proposal_id = get_proposal_id(vm),
                                       .support = support == "yes"};
  }
  if (payload == "close_proposal") {
    return ballot::schema::close_proposal_t{.proposal_id = get_proposal_id(vm)};
  }
  if (payload == "transfer_administrator") {
    return ballot::schema::transfer_administrator_t{
        .new_administrator = get_address(vm, "new-administrator")};
  }
  std::cerr << "unsupported payload '" << payload << "'\n";
  ballot::common::critical("unsupported payload type");
}

ballot::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/governance/administrator" ||
      path == "/governance/proposal_count" ||
      path == "/governance/proposal_ids" ||
      path == "/governance/active_proposal_ids") {
    return {};
  }
  if (path == "/governance/proposal" || path == "/governance/proposal_info" ||
      path == "/governance/vote_percentages" ||
      path == "/governance/proposal_result") {
    return encoder.encode(get_proposal_id(vm));
  }
  if (path == "/governance/has_voted") {
    return encoder.encode(
        std::tuple{get_proposal_id(vm), get_address(vm, "voter")});
  }
  if (path == "/events/range") {
    return encoder.encode(std::tuple{vm["from-sequence"].as<uint64_t>(),
                                     vm["to-sequence"].as<uint64_t>()});
  }
  std::cerr << "unsupported query path '" << path << "'\n";
  ballot::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  ballot_transaction_builder transaction --payload <type> "
               "[options]\n"
            << "  ballot_transaction_builder query-key --path <route> "
               "[options]\n"
            << "  ballot_transaction_builder chain-id [--chain-name <name>]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"ballot_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|chain-id")(
      "payload", po::value<std::string>(),
      "create_proposal|cast_vote|close_proposal|transfer_administrator")(
      "path", po::value<std::string>(), "engine query route")(
      "format", po::value<std::string>()->default_value("base64"),
      "hex|base64")("chain-id", po::value<std::string>(),
                    "32-byte chain id hex")(
      "chain-name",
      po::value<std::string>()->default_value(std::string{kDefaultChainName}),
      "chain name hashed into the chain id")(
      "signer", po::value<std::string>(), "signer address hex")(
      "title", po::value<std::string>(), "proposal title")(
      "description", po::value<std::string>(), "proposal description")(
      "proposal-id", po::value<uint64_t>(), "proposal id")(
      "support", po::value<std::string>()->default_value("yes"), "yes|no")(
      "new-administrator", po::value<std::string>(),
      "new administrator address hex")("voter", po::value<std::string>(),
                                       "voter address hex")(
      "from-sequence", po::value<uint64_t>()->default_value(1),
      "event range from")("to-sequence",
                          po::value<uint64_t>()->default_value(1),
                          "event range to");

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
    print_help(options);
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      ballot::common::critical("transaction mode requires --payload");
    }
    auto transaction =
        ballot::schema::transaction_t{.version = 1,
                                      .chain_id = get_chain_id(vm),
                                      .signer = get_address(vm, "signer"),
                                      .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << format_bytes(vm, encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      ballot::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << format_bytes(vm, key) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id = get_chain_id(vm);
    std::cout << ballot::schema::to_hex(ballot::schema::bytes_view_t{
                     chain_id.data(), chain_id.size()})
              << '\n';
    return 0;
  }

  ballot::common::critical("command must be transaction|query-key|chain-id");
}
