// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <sandsock/sandsock.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#define SANDSOCK_DEFAULT_CONFIG_FILE_PATH "/etc/sandsock.conf.d/sandsock.toml"

namespace
{

std::atomic<bool> g_terminate{false};

struct CliOptions
{
  std::optional<std::string> configFile;
  std::vector<std::string> command;
};

/// \brief Print help message
void printHelp()
{
  std::cout << "Usage: sandsock [options] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  echo-server <addr> <port>        Echo TCP connections until interrupted\n"
            << "  send <host> <port> <text>        Connect, send text, print one reply\n"
            << "  datagram <host> <port> <text>    Send one UDP datagram\n"
            << "  ports [addr]                     Print available local ports\n"
            << "\n"
            << "Options:\n"
            << "  -h, --help                       Show this help message\n"
            << "  -c, --config <file>              Configuration file path\n"
            << "  -l, --log-level <level>          Log level (trace, debug, info, "
               "warning, error, fatal)\n"
            << "  -f, --log-file <file>            Log file path\n"
            << "      --log-async                  Enable async logging\n"
            << "      --local-address <addr>       Local IPv4 address for bindings\n"
            << "      --threadpool-min <n>         Echo server minimum threads (default: 2)\n"
            << "      --threadpool-max <n>         Echo server maximum threads (default: 8)\n";
}

std::size_t parseCount(const std::string &value, const std::string &what)
{
  try
  {
    int n = std::stoi(value);
    if (n <= 0)
    {
      throw std::out_of_range(what);
    }
    return static_cast<std::size_t>(n);
  }
  catch (const std::exception &)
  {
    throw std::runtime_error("Invalid " + what + ": " + value);
  }
}

std::uint16_t parsePort(const std::string &value)
{
  int n = 0;
  try
  {
    n = std::stoi(value);
  }
  catch (const std::exception &)
  {
    throw std::runtime_error("Invalid port number: " + value);
  }
  if (n < 1 || n > 65535)
  {
    throw std::runtime_error("Invalid port number: " + value);
  }
  return static_cast<std::uint16_t>(n);
}

/// \brief Parse command-line arguments; command-line values win over the
/// configuration file.
CliOptions parseCliArgs(int argc, char **argv, sandsock::SocketLayer::Config &config)
{
  CliOptions cli;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc)
    {
      cli.configFile = argv[++i];
    }
    else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
    {
      config.log.level = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
    {
      config.log.file = argv[++i];
    }
    else if (arg == "--log-async")
    {
      config.log.async = true;
    }
    else if (arg == "--local-address" && i + 1 < argc)
    {
      config.localAddress = argv[++i];
    }
    else if (arg == "--threadpool-min" && i + 1 < argc)
    {
      config.threadPool.minThreads = parseCount(argv[++i], "threadpool min threads");
    }
    else if (arg == "--threadpool-max" && i + 1 < argc)
    {
      config.threadPool.maxThreads = parseCount(argv[++i], "threadpool max threads");
    }
    else if (arg == "-h" || arg == "--help")
    {
      printHelp();
      std::exit(0);
    }
    else if (arg.length() > 1 && arg[0] == '-')
    {
      throw std::runtime_error("Unknown option: " + arg);
    }
    else
    {
      cli.command.push_back(arg);
    }
  }
  return cli;
}

/// \brief Merge the TOML file. An explicit -c file must load; the default
/// path is optional.
void parseTomlConfig(sandsock::SocketLayer::Config &config, const CliOptions &cli)
{
  std::string path = cli.configFile.value_or(SANDSOCK_DEFAULT_CONFIG_FILE_PATH);
  try
  {
    sandsock::core::ConfigLoader loader(path);
    config.mergeFrom(loader);
  }
  catch (const std::exception &e)
  {
    if (cli.configFile)
    {
      throw;
    }
    SANDSOCK_LOG_DEBUG("No default configuration loaded: " << e.what());
  }
}

void initLogging(const sandsock::SocketLayer::Config::LogConfig &log)
{
  using sandsock::core::Logger;
  Logger::init(Logger::levelFromString(log.level.value_or("info")), log.file.value_or(""),
               log.async.value_or(false), log.retentionDays.value_or(7));
  if (log.format)
  {
    Logger::setLogFormat(*log.format);
  }
}

void requireArgs(const std::vector<std::string> &command, std::size_t count)
{
  if (command.size() < count)
  {
    throw std::runtime_error("'" + command[0] + "' needs " + std::to_string(count - 1) +
                             " argument(s); see --help");
  }
}

int runEchoServer(sandsock::SocketLayer &layer, const sandsock::SocketLayer::Config &config,
                  const std::vector<std::string> &command)
{
  requireArgs(command, 3);
  const auto &tp = config.threadPool;
  auto pool = std::make_shared<sandsock::core::ThreadPool>(
    tp.minThreads.value_or(2), tp.maxThreads.value_or(8),
    std::chrono::duration_cast<std::chrono::milliseconds>(
      tp.idleTimeout.value_or(std::chrono::seconds(60))),
    tp.queueSize.value_or(128));

  sandsock::net::ListenerOptions options;
  options.threadPool = pool;
  auto stop = layer.listenForConnection(
    command[1], parsePort(command[2]),
    [](std::shared_ptr<sandsock::net::Socket> socket)
    {
      socket->setTimeout(std::chrono::seconds(30));
      try
      {
        while (true)
        {
          auto data = socket->receive(4096);
          if (socket->sendAll(data) < data.size())
          {
            break;
          }
        }
      }
      catch (const sandsock::net::SocketException &e)
      {
        SANDSOCK_LOG_DEBUG("Echo session with " << socket->getRemoteEndpoint()
                                                << " ended: " << e.what());
      }
      socket->close();
    },
    options);

  std::cout << "Echoing on " << command[1] << ":" << command[2] << ", Ctrl-C to stop" << std::endl;
  while (!g_terminate.load())
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  stop();
  return EXIT_SUCCESS;
}

int runSend(sandsock::SocketLayer &layer, const std::vector<std::string> &command)
{
  requireArgs(command, 4);
  auto socket = layer.openConnection(command[1], parsePort(command[2]));
  auto payload = sandsock::net::toBytes(command[3]);
  if (socket->sendAll(payload) != payload.size())
  {
    socket->close();
    throw std::runtime_error("connection closed while sending");
  }

  socket->setTimeout(std::chrono::seconds(5));
  auto reply = socket->receive(65536);
  std::cout << sandsock::net::toString(reply) << std::endl;
  socket->close();
  return EXIT_SUCCESS;
}

int runDatagram(sandsock::SocketLayer &layer, const std::vector<std::string> &command)
{
  requireArgs(command, 4);
  std::size_t sent =
    layer.sendMessage(command[1], parsePort(command[2]), sandsock::net::toBytes(command[3]));
  std::cout << "Sent " << sent << " bytes" << std::endl;
  return EXIT_SUCCESS;
}

void printPorts(const char *label, const std::vector<std::uint16_t> &ports)
{
  std::cout << label << ": " << ports.size() << " free";
  if (!ports.empty())
  {
    std::cout << " (" << ports.front() << "-" << ports.back() << ")";
  }
  std::cout << std::endl;
}

int runPorts(sandsock::SocketLayer &layer, const std::vector<std::string> &command)
{
  std::optional<std::string> address;
  if (command.size() > 1)
  {
    address = command[1];
  }
  printPorts("TCP", layer.availableConnectPorts(address));
  printPorts("UDP", layer.availableMessagePorts(address));
  return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char **argv)
{
  try
  {
    sandsock::SocketLayer::Config config;
    CliOptions cli = parseCliArgs(argc, argv, config);
    parseTomlConfig(config, cli);
    initLogging(config.log);

    if (cli.command.empty())
    {
      printHelp();
      return EXIT_FAILURE;
    }

    std::signal(SIGINT, [](int) { g_terminate.store(true); });
    std::signal(SIGTERM, [](int) { g_terminate.store(true); });

    auto layer = sandsock::SocketLayer::createDefault(config);
    const std::string &name = cli.command[0];
    int rc = EXIT_FAILURE;
    if (name == "echo-server")
    {
      rc = runEchoServer(*layer, config, cli.command);
    }
    else if (name == "send")
    {
      rc = runSend(*layer, cli.command);
    }
    else if (name == "datagram")
    {
      rc = runDatagram(*layer, cli.command);
    }
    else if (name == "ports")
    {
      rc = runPorts(*layer, cli.command);
    }
    else
    {
      throw std::runtime_error("Unknown command: " + name);
    }

    layer.reset();
    sandsock::core::Logger::shutdown();
    return rc;
  }
  catch (const std::exception &ex)
  {
    std::cerr << "sandsock: " << ex.what() << std::endl;
    sandsock::core::Logger::shutdown();
    return EXIT_FAILURE;
  }
}
