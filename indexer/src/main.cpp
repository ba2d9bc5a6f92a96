#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/database.hpp"
#include "core/errors.hpp"
#include "core/manifest.hpp"
#include "core/store.hpp"
#include "infra/rpc_client.hpp"
#include "obs/event_journal.hpp"
#include "obs/metrics.hpp"
#include "obs/metrics_server.hpp"
#include "sync/backfill_worker.hpp"
#include "sync/chain_session.hpp"
#include "sync/event_processor.hpp"
#include "sync/tail_loop.hpp"

using json = nlohmann::json;

constexpr int EXIT_FAILED = 1;
constexpr int EXIT_CONFIG = 2;
constexpr int EXIT_NOT_DEPLOYED = 3;

void print_usage(const char *prog) {
  std::cout << "用法:\n"
            << "  " << prog
            << " tail     --config <config.json> [--rpc-url URL] [--manifest PATH] [--backfill-from N [--backfill-to N]]\n"
            << "  " << prog
            << " backfill --config <config.json> --from N [--to N|latest] [--rpc-url URL] [--manifest PATH]"
            << std::endl;
}

struct Args {
  std::string mode;
  std::string config_path = "config.json";
  json overrides = json::object();
  std::optional<int64_t> from_block;
  std::optional<int64_t> to_block; // 空 = latest
  // tail 模式下同进程并行回填
  std::optional<int64_t> backfill_from;
  std::optional<int64_t> backfill_to;
};

int64_t parse_block(const std::string &flag, const std::string &value) {
  try {
    size_t pos = 0;
    int64_t v = std::stoll(value, &pos);
    if (pos != value.size() || v < 0)
      throw ConfigError(flag + " must be a non-negative block number: " + value);
    return v;
  } catch (const std::invalid_argument &) {
    throw ConfigError(flag + " must be a block number: " + value);
  } catch (const std::out_of_range &) {
    throw ConfigError(flag + " out of range: " + value);
  }
}

Args parse_args(int argc, char *argv[]) {
  Args args;
  if (argc < 2)
    throw ConfigError("missing mode (tail | backfill)");
  args.mode = argv[1];
  if (args.mode != "tail" && args.mode != "backfill")
    throw ConfigError("unknown mode: " + args.mode);

  for (int i = 2; i < argc; ++i) {
    auto next = [&](const char *flag) -> std::string {
      if (i + 1 >= argc)
        throw ConfigError(std::string(flag) + " needs a value");
      return argv[++i];
    };

    if (std::strcmp(argv[i], "--config") == 0) {
      args.config_path = next("--config");
    } else if (std::strcmp(argv[i], "--rpc-url") == 0) {
      args.overrides["rpc_url"] = next("--rpc-url");
    } else if (std::strcmp(argv[i], "--manifest") == 0) {
      args.overrides["deployment_manifest"] = next("--manifest");
    } else if (std::strcmp(argv[i], "--from") == 0) {
      args.from_block = parse_block("--from", next("--from"));
    } else if (std::strcmp(argv[i], "--to") == 0) {
      std::string v = next("--to");
      if (v != "latest")
        args.to_block = parse_block("--to", v);
    } else if (std::strcmp(argv[i], "--backfill-from") == 0) {
      args.backfill_from = parse_block("--backfill-from", next("--backfill-from"));
    } else if (std::strcmp(argv[i], "--backfill-to") == 0) {
      std::string v = next("--backfill-to");
      if (v != "latest")
        args.backfill_to = parse_block("--backfill-to", v);
    } else {
      throw ConfigError(std::string("unknown argument: ") + argv[i]);
    }
  }

  if (args.mode == "backfill" && !args.from_block)
    throw ConfigError("backfill needs --from");
  if (args.mode == "tail" && (args.from_block || args.to_block))
    throw ConfigError("tail takes --backfill-from / --backfill-to, not --from / --to");
  if (args.mode == "backfill" && (args.backfill_from || args.backfill_to))
    throw ConfigError("--backfill-from / --backfill-to are tail options");
  if (args.backfill_to && !args.backfill_from)
    throw ConfigError("--backfill-to needs --backfill-from");
  return args;
}

// 所有监听合约在当前高度都必须有代码
void check_watched_deployed(ChainReader &chain, const std::vector<WatchedEvent> &watched) {
  int64_t head = chain.block_number();
  std::set<std::string> checked;
  for (const auto &w : watched) {
    if (!checked.insert(w.address).second)
      continue;
    if (!has_code(chain.get_code(w.address, head)))
      throw DeploymentNotFound(w.address);
    std::cout << "[Main] " << w.contract << " at " << w.address << std::endl;
  }
}

int report_backfill(const BackfillReport &report) {
  auto failed = report.failed();
  if (failed.empty())
    return 0;

  std::cerr << "[Main] backfill finished with " << failed.size() << " failed chunk(s):" << std::endl;
  for (const auto &c : failed) {
    std::cerr << "  " << c.from << ".." << c.to << ": " << c.error << std::endl;
  }
  return EXIT_FAILED;
}

// tail 旁边的回填: 自己的 RPC 客户端, 连接和处理器, 跑在单独线程
struct SideBackfill {
  SideBackfill(const Config &config, Database &db, const std::vector<WatchedEvent> &watched,
               const ChainSession &session, Metrics &metrics, EventJournal *journal)
      : rpc(config.rpc_url, config.rpc_api_key, config.rpc_timeout_seconds, config.log_rpc_calls), store(db),
        processor(rpc, store, session, metrics, journal, config.record_unknown_events),
        worker(rpc, processor, watched, metrics, config.backfill_chunk_size) {}

  RpcClient rpc;
  Store store;
  EventProcessor processor;
  BackfillWorker worker;
};

int run_tail(const Args &args, const Config &config, Database &db, RpcClient &rpc, Store &store,
             EventProcessor &processor, const std::vector<WatchedEvent> &watched, const ChainSession &session,
             Metrics &metrics, EventJournal *journal) {
  TailLoop loop(config, rpc, store, processor, watched, session, metrics);

  std::unique_ptr<SideBackfill> side;
  int64_t backfill_to = 0;
  if (args.backfill_from) {
    side = std::make_unique<SideBackfill>(config, db, watched, session, metrics, journal);
    backfill_to = args.backfill_to ? *args.backfill_to : side->rpc.block_number();
  }

  boost::asio::io_context ioc;
  loop.start(ioc);

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &, int) {
    std::cout << "\n[Main] 正在关闭..." << std::endl;
    loop.stop();
    if (side)
      side->worker.stop();
    ioc.stop();
  });

  // 回填使用单独的线程, 主线程跑 tail
  std::thread backfill_thread;
  int backfill_code = 0;
  if (side) {
    int64_t from = *args.backfill_from;
    std::cout << "[Main] backfill " << from << ".." << backfill_to << " alongside tail" << std::endl;
    backfill_thread = std::thread([&side, &backfill_code, from, backfill_to]() {
      backfill_code = report_backfill(side->worker.run(from, backfill_to));
    });
  }

  std::cout << "[Main] tailing" << std::endl;
  ioc.run();

  if (backfill_thread.joinable()) {
    std::cout << "[Main] 等待回填结束..." << std::endl;
    backfill_thread.join();
  }
  return backfill_code;
}

int run_backfill(const Args &args, RpcClient &rpc, EventProcessor &processor, const std::vector<WatchedEvent> &watched,
                 Metrics &metrics, int64_t chunk_size) {
  int64_t to = args.to_block ? *args.to_block : rpc.block_number();
  BackfillWorker worker(rpc, processor, watched, metrics, chunk_size);
  return report_backfill(worker.run(*args.from_block, to));
}

int run(const Args &args) {
  Config config = Config::load(args.config_path, args.overrides);

  std::cout << "========================================" << std::endl;
  std::cout << "    Grant Indexer (" << args.mode << ")" << std::endl;
  std::cout << "========================================" << std::endl;
  std::cout << "[Main] RPC: " << config.rpc_url << std::endl;
  std::cout << "[Main] Manifest: " << config.deployment_manifest << std::endl;

  Manifest manifest = Manifest::load(config.deployment_manifest, config.abi_dir);
  const ContractInfo &anchor = require_anchor(manifest, config);
  std::vector<WatchedEvent> watched = bind_catalog(manifest);
  if (watched.empty())
    throw ConfigError("no catalog event could be bound to the deployment manifest");

  RpcClient rpc(config.rpc_url, config.rpc_api_key, config.rpc_timeout_seconds, config.log_rpc_calls);

  Database db(config.db_path);
  db.init_schema();
  std::cout << "[Main] DB Path: " << db.path() << std::endl;
  Store store(db);

  ChainSessionManager sessions(rpc, store);
  ChainSession session = sessions.get_or_create(anchor.address);
  check_watched_deployed(rpc, watched);

  Metrics metrics;
  std::unique_ptr<EventJournal> journal;
  if (!config.event_journal_path.empty()) {
    journal = std::make_unique<EventJournal>(config.event_journal_path);
    std::cout << "[Main] Journal: " << journal->path() << std::endl;
  }
  EventProcessor processor(rpc, store, session, metrics, journal.get(), config.record_unknown_events);

  // 指标服务使用单独的 io_context 和线程
  std::unique_ptr<MetricsEndpoint> metrics_endpoint;
  if (config.metrics_port > 0) {
    std::string session_id = session.session_id;
    try {
      metrics_endpoint = std::make_unique<MetricsEndpoint>(
          metrics, static_cast<unsigned short>(config.metrics_port), [&metrics, session_id]() {
            return json{{"session_id", session_id}, {"last_processed_block", metrics.last_processed_block.load()}};
          });
    } catch (const boost::system::system_error &e) {
      throw ConfigError("cannot listen on metrics_port " + std::to_string(config.metrics_port) + ": " + e.what());
    }
  }

  int code = args.mode == "tail"
                 ? run_tail(args, config, db, rpc, store, processor, watched, session, metrics, journal.get())
                 : run_backfill(args, rpc, processor, watched, metrics, config.backfill_chunk_size);

  std::cout << "[Main] 已退出" << std::endl;
  return code;
}

int main(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
  }

  try {
    return run(parse_args(argc, argv));
  } catch (const ConfigError &e) {
    std::cerr << "[Main] config error: " << e.what() << std::endl;
    print_usage(argv[0]);
    return EXIT_CONFIG;
  } catch (const DeploymentNotFound &e) {
    std::cerr << "[Main] no contract code at " << e.address() << ", is the chain running the deployment?"
              << std::endl;
    return EXIT_NOT_DEPLOYED;
  } catch (const RpcError &e) {
    std::cerr << "[Main] RPC error during startup: " << e.what() << std::endl;
    return EXIT_FAILED;
  } catch (const PersistenceError &e) {
    std::cerr << "[Main] database error: " << e.what() << std::endl;
    return EXIT_FAILED;
  } catch (const std::exception &e) {
    std::cerr << "[Main] fatal: " << e.what() << std::endl;
    return EXIT_FAILED;
  }
}
