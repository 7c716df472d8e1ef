#include "sentinel/cli.hpp"
#include "sentinel/config.hpp"
#include "sentinel/token.hpp"
#include "sentinel/web_server.hpp"
#include <CLI/CLI.hpp>
#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <thread>

namespace sentinel::cli
{

	namespace
	{
		void log_startup(const GatewayConfig &cfg)
		{
			auto names = cfg.service_names();
			std::string joined;
			for (const auto &name : names)
			{
				if (!joined.empty())
					joined += ", ";
				joined += name;
			}
			spdlog::info("loaded {} service(s): {}", names.size(), joined);
			if (cfg.agents)
				spdlog::info("auth mode: per-agent tokens ({} agents)", cfg.agents->size());
			else
				spdlog::info("auth mode: legacy single token (AGENT_TOKEN)");
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Sentinel credential-isolating request gateway"};
		app.require_subcommand(0, 1);

		std::string services_path;
		std::string agents_path;

		auto serve_cmd = app.add_subcommand("serve", "Load config and run the gateway");
		serve_cmd->add_option("--services", services_path, "Services TOML path (default services.toml)");
		serve_cmd->add_option("--agents", agents_path, "Agents TOML path (default agents.toml)");
		std::uint16_t serve_port{8080};
		std::size_t serve_threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
		auto port_opt = serve_cmd->add_option("--port", serve_port, "Port to bind (overrides config and PORT)");
		auto threads_opt = serve_cmd->add_option("--threads", serve_threads, "Number of worker threads")->check(CLI::PositiveNumber);

		auto cfg_cmd = app.add_subcommand("config-print", "Validate config and print it as JSON (tokens redacted)");
		cfg_cmd->add_option("--services", services_path, "Services TOML path");
		cfg_cmd->add_option("--agents", agents_path, "Agents TOML path");

		auto token_cmd = app.add_subcommand("token-generate", "Print a fresh agent token");

		CLI11_PARSE(app, argc, argv);

		if (*cfg_cmd)
		{
			auto cfg = ConfigLoader::load(services_path, agents_path);
			if (!cfg)
			{
				std::cerr << cfg.error().what() << std::endl;
				return 1;
			}
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (*token_cmd)
		{
			auto token = token::generate();
			if (!token)
			{
				std::cerr << token.error().what() << std::endl;
				return 1;
			}
			std::cout << *token << std::endl;
			return 0;
		}

		if (*serve_cmd)
		{
			auto cfg = ConfigLoader::load(services_path, agents_path);
			if (!cfg)
			{
				spdlog::critical("configuration error: {}", cfg.error().what());
				return 1;
			}
			if (*port_opt)
				cfg->server.port = serve_port;
			if (*threads_opt)
				cfg->server.threads = serve_threads;

			log_startup(*cfg);
			try
			{
				WebServer server(std::move(*cfg));
				server.run();
			}
			catch (const SentinelError &e)
			{
				spdlog::critical("startup failed: {}", e.what());
				return 1;
			}
			catch (const boost::system::system_error &e)
			{
				spdlog::critical("unable to listen: {}", e.what());
				return 1;
			}
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace sentinel::cli
