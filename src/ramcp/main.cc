#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "ramcp/mcp_server.h"
#include "ramcp/mcp_transport.h"
#include "ramcp/options.h"
#include "ramcp/tool_registry.h"
#include "ramcp_core/config.h"
#include "ramcp_core/logging.h"
#include "ramcp_core/protocol_client.h"
#include "ramcp_core/rust_analyzer.h"

int main(int argc, const char* argv[]) {
  using namespace ramcp;

  server::Options options;
  std::string error;
  if (!server::ParseArgs(argc, argv, &options, &error)) {
    std::cerr << error << "\n\n";
    server::PrintUsage(argv[0]);
    return 2;
  }
  if (options.show_help) {
    server::PrintUsage(argv[0]);
    return 0;
  }

  Config config;
  std::filesystem::path config_dir;
  if (!server::ResolveConfig(options, &config, &config_dir, &error)) {
    std::cerr << error << "\n";
    return 1;
  }
  UpdateLogConfig(config, config_dir);
  Log("ramcp starting in " + config.workspace_root.string());

  ClientOptions client_options;
  client_options.backend.executable = config.rust_analyzer_path;
  client_options.backend.args = config.rust_analyzer_args;
  client_options.workspace_root = config.workspace_root;
  client_options.request_timeout = std::chrono::milliseconds(config.request_timeout_ms);
  client_options.shutdown_grace = std::chrono::milliseconds(config.shutdown_grace_ms);
  client_options.client_version = server::kServerVersion;

  ProtocolClient client(client_options);
  std::unique_ptr<RustAnalyzer> analyzer;
  Error start_error;
  if (client.Start(&start_error)) {
    analyzer = std::make_unique<RustAnalyzer>(
        &client, std::chrono::milliseconds(config.diagnostics_wait_ms));
  } else {
    // Command-line tools still work without the backend.
    Log("rust-analyzer unavailable: " + start_error.ToString());
  }

  server::ToolContext context;
  context.analyzer = analyzer.get();
  context.tools.rustfmt = config.rustfmt_path;
  context.tools.cargo = config.cargo_path;
  context.workspace_root = config.workspace_root;
  server::ToolRegistry registry(context);

  std::ios::sync_with_stdio(false);
  server::McpTransport transport(std::cin, std::cout);
  server::McpServer mcp(&registry);
  mcp.Run(&transport);

  analyzer.reset();
  client.Shutdown();
  Log("ramcp exiting");
  return 0;
}
