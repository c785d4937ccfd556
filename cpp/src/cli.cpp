#include "ferry/cli.hpp"
#include "ferry/config.hpp"
#include "ferry/crypto.hpp"
#include "ferry/deployment.hpp"
#include "ferry/envelope.hpp"
#include "ferry/rpc_server.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <vector>

namespace ferry::cli
{
	namespace
	{
		void init_logging(const std::string &level)
		{
			spdlog::set_level(spdlog::level::from_str(level));
			spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
		}

		Result<crypto::Ed25519KeyPair> load_keypair(const std::string &path)
		{
			std::ifstream keyf(path);
			if (!keyf.is_open())
				return std::unexpected(FerryError::config("Unable to open key file " + path));
			std::stringstream kbuf;
			kbuf << keyf.rdbuf();
			return crypto::Ed25519KeyPair::from_json(kbuf.str());
		}

		// Request an operation and sign it with the first three signers
		Result<void> run_quorum(BridgeLedger &ledger,
								const std::vector<crypto::Ed25519KeyPair> &signers,
								OperationKind kind,
								const Identity &target,
								const Amount &value,
								const Bytes &payload = {})
		{
			auto code = ledger.codes().code_of(kind);
			if (!code)
				return std::unexpected(FerryError::invalid_input("Invalid operation type"));

			auto id = ledger.request_operation(signers[0].identity(), *code, target, value, payload);
			if (!id)
				return std::unexpected(id.error());

			auto hash = ledger.get_operation_hash(*id);
			for (std::size_t i = 0; i < kQuorumThreshold; ++i)
			{
				auto proof = crypto::MessageSigner::sign_digest(signers[i], hash);
				auto done = ledger.submit_signature(signers[i].identity(), *id, proof);
				if (!done)
					return std::unexpected(done.error());
			}
			spdlog::info("[{}] {} executed", ledger.name(), operation_kind_to_string(kind));
			return {};
		}

		Digest transfer_id_of(const Event &event)
		{
			auto text = event.to_json().dump();
			return crypto::SHA256::hash(text);
		}

		// Two-chain round trip: origin token out to a sibling chain and back
		Result<void> run_demo()
		{
			std::vector<crypto::Ed25519KeyPair> keys;
			for (int i = 0; i < 7; ++i)
			{
				auto kp = crypto::Ed25519KeyPair::generate();
				if (!kp)
					return std::unexpected(kp.error());
				keys.push_back(*kp);
			}
			std::vector<crypto::Ed25519KeyPair> signers(keys.begin(), keys.begin() + 4);
			const auto &admin = keys[4];
			const auto &relayer = keys[5];
			const auto &user = keys[6];

			auto clock = std::make_shared<ManualClock>();
			auto events = std::make_shared<EventLog>(AuditConfig{true, ""});

			SignerRegistry::Slots slots{};
			for (std::size_t i = 0; i < slots.size(); ++i)
				slots[i] = signers[i].identity();

			LedgerSettings origin_settings;
			origin_settings.name = "origin";
			origin_settings.chain_id = 1;
			origin_settings.account = derive_account("origin");
			origin_settings.admin = admin.identity();
			origin_settings.signers = slots;

			auto sibling_settings = origin_settings;
			sibling_settings.name = "sibling";
			sibling_settings.chain_id = 2;
			sibling_settings.account = derive_account("sibling");

			auto origin = PrimaryLedger::create(origin_settings, clock, events);
			if (!origin)
				return std::unexpected(origin.error());
			auto sibling = BurnMintLedger::create(sibling_settings, clock, events);
			if (!sibling)
				return std::unexpected(sibling.error());

			auto &a = **origin;
			auto &b = **sibling;
			auto amount = whole_tokens(1'000);

			if (auto minted = run_quorum(a, signers, OperationKind::Mint, kZeroIdentity, 0); !minted)
				return minted;
			if (auto given = run_quorum(a, signers, OperationKind::DistributeTokens, user.identity(), amount); !given)
				return given;
			if (auto launched = run_quorum(a, signers, OperationKind::PostLaunch, kZeroIdentity, 0); !launched)
				return launched;
			for (BridgeLedger *ledger : {static_cast<BridgeLedger *>(&a), static_cast<BridgeLedger *>(&b)})
			{
				auto relayed = run_quorum(*ledger, signers, OperationKind::SetBridgeInCaller, relayer.identity(), 0);
				if (!relayed)
					return relayed;
			}

			auto out = a.bridge_out(user.identity(), amount, user.identity(), a.get_chain_id(), b.get_chain_id());
			if (!out)
				return std::unexpected(out.error());
			auto outbound = events->last("BridgedOut");
			if (!outbound)
				return std::unexpected(FerryError::internal("BridgedOut event missing"));

			auto in = b.bridge_in(relayer.identity(), user.identity(), amount, b.get_chain_id(),
								  transfer_id_of(*outbound), a.get_chain_id());
			if (!in)
				return std::unexpected(in.error());
			spdlog::info("sibling balance of user: {}", amount_to_string(b.balance_of(user.identity())));

			clock->advance(b.limits().cooldown);
			auto back = b.bridge_out(user.identity(), amount, user.identity(), b.get_chain_id(), a.get_chain_id());
			if (!back)
				return std::unexpected(back.error());
			auto returning = events->last("BridgedOut");
			if (!returning)
				return std::unexpected(FerryError::internal("BridgedOut event missing"));

			clock->advance(a.limits().cooldown);
			auto home = a.bridge_in(relayer.identity(), user.identity(), amount, a.get_chain_id(),
									transfer_id_of(*returning), b.get_chain_id());
			if (!home)
				return std::unexpected(home.error());

			nlohmann::json summary{{"origin", a.describe()},
								   {"sibling", b.describe()},
								   {"user_origin_balance", amount_to_string(a.balance_of(user.identity()))},
								   {"user_sibling_balance", amount_to_string(b.balance_of(user.identity()))},
								   {"events", events->events().size()},
								   {"audit_chain_valid", events->verify_chain()}};
			std::cout << summary.dump(2) << std::endl;
			return {};
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Ferry multi-sig bridge ledgers"};

		std::string config_path{"ferry.toml"};
		std::string log_level;
		app.add_option("--config", config_path, "Path to config TOML");
		app.add_option("--log-level", log_level, "trace, debug, info, warn, error");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");
		cfg_cmd->add_option("--file", config_path, "Config path");

		std::string keygen_out;
		auto keygen_cmd = app.add_subcommand("keygen", "Generate an Ed25519 identity");
		keygen_cmd->add_option("--out", keygen_out, "Output file path (defaults to stdout)");

		std::string key_path;
		std::string digest_hex;
		auto sign_digest_cmd = app.add_subcommand("sign-digest", "Sign an operation hash for submit_signature");
		sign_digest_cmd->add_option("--key", key_path, "Path to Ed25519 keypair JSON (base64 fields)")->required();
		sign_digest_cmd->add_option("--digest", digest_hex, "Operation hash (hex)")->required();

		std::uint64_t req_nonce{0};
		std::string req_route;
		std::string req_body{"{}"};
		auto sign_request_cmd = app.add_subcommand("sign-request", "Emit a signed request envelope");
		sign_request_cmd->add_option("--key", key_path, "Path to Ed25519 keypair JSON (base64 fields)")->required();
		sign_request_cmd->add_option("--nonce", req_nonce, "Caller nonce")->required();
		sign_request_cmd->add_option("--route", req_route, "Request path, e.g. /ledgers/vault/bridge_out")->required();
		sign_request_cmd->add_option("--body", req_body, "Request body JSON");

		std::optional<std::uint16_t> serve_port;
		std::optional<std::size_t> serve_threads;
		auto serve_cmd = app.add_subcommand("serve", "Run the bridge gateway over the configured ledgers");
		serve_cmd->add_option("--port", serve_port, "Port to bind");
		serve_cmd->add_option("--threads", serve_threads, "Number of worker threads");

		auto demo_cmd = app.add_subcommand("demo", "Run an in-process two-chain bridge round trip");

		CLI11_PARSE(app, argc, argv);

		init_logging(log_level.empty() ? "info" : log_level);

		if (*cfg_cmd)
		{
			auto cfg = ConfigLoader::load(config_path);
			if (!cfg)
			{
				std::cerr << cfg.error().what() << std::endl;
				return 1;
			}
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (*keygen_cmd)
		{
			auto kp = crypto::Ed25519KeyPair::generate();
			if (!kp)
			{
				std::cerr << kp.error().what() << std::endl;
				return 1;
			}
			if (keygen_out.empty())
			{
				std::cout << kp->to_json() << std::endl;
			}
			else
			{
				std::ofstream out(keygen_out);
				if (!out.is_open())
				{
					std::cerr << "Unable to open output file" << std::endl;
					return 1;
				}
				out << kp->to_json() << std::endl;
			}
			std::cerr << "identity " << to_hex(kp->identity()) << std::endl;
			return 0;
		}

		if (*sign_digest_cmd)
		{
			auto kp = load_keypair(key_path);
			if (!kp)
			{
				std::cerr << kp.error().what() << std::endl;
				return 1;
			}
			auto digest = from_hex32(digest_hex);
			if (!digest)
			{
				std::cerr << digest.error().what() << std::endl;
				return 1;
			}
			std::cout << bytes_to_hex(crypto::MessageSigner::sign_digest(*kp, *digest)) << std::endl;
			return 0;
		}

		if (*sign_request_cmd)
		{
			auto kp = load_keypair(key_path);
			if (!kp)
			{
				std::cerr << kp.error().what() << std::endl;
				return 1;
			}
			nlohmann::json body;
			try
			{
				body = nlohmann::json::parse(req_body);
			}
			catch (const nlohmann::json::exception &e)
			{
				std::cerr << "Invalid body JSON: " << e.what() << std::endl;
				return 1;
			}
			auto envelope = SignedEnvelope::sign(*kp, req_nonce, req_route, body);
			std::cout << envelope.to_json().dump() << std::endl;
			return 0;
		}

		if (*serve_cmd)
		{
			auto cfg = ConfigLoader::load(config_path);
			if (!cfg)
			{
				std::cerr << cfg.error().what() << std::endl;
				return 1;
			}
			if (log_level.empty())
				init_logging(cfg->logging.level);

			auto deployment = Deployment::build(*cfg,
												std::make_shared<SystemClock>(),
												std::make_shared<EventLog>(cfg->audit));
			if (!deployment)
			{
				std::cerr << deployment.error().what() << std::endl;
				return 1;
			}

			RpcServerConfig rsc{
				serve_port.value_or(cfg->server.port),
				serve_threads.value_or(cfg->server.threads),
				RateLimiter::Config{cfg->server.requests_per_second, cfg->server.burst}};
			RpcServer server(**deployment, rsc);
			server.run();
			return 0;
		}

		if (*demo_cmd)
		{
			auto result = run_demo();
			if (!result)
			{
				std::cerr << result.error().what() << std::endl;
				return 2;
			}
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace ferry::cli
