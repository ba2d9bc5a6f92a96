#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/database.hpp"
#include "core/errors.hpp"
#include "core/store.hpp"
#include "mock_chain.hpp"
#include "obs/event_journal.hpp"
#include "obs/metrics.hpp"
#include "sync/chain_session.hpp"
#include "sync/event_processor.hpp"
#include "sync/projection.hpp"

using json = nlohmann::json;

namespace {

struct Harness {
  explicit Harness(const std::string &name) : db(fixture::temp_db(name)) {
    db.init_schema();
    store = std::make_unique<Store>(db);
    chain.head = 100;
    chain.deployed_at[fixture::REGISTRY] = 1;
    chain.deployed_at[fixture::VAULT] = 1;
    ChainSessionManager manager(chain, *store);
    session = manager.get_or_create(fixture::REGISTRY);
  }

  MockChain chain;
  Database db;
  std::unique_ptr<Store> store;
  ChainSession session;
  Metrics metrics;
};

void test_idempotent_processing() {
  Harness h("processor_idempotent");
  EventProcessor processor(h.chain, *h.store, h.session, h.metrics);

  EventLog grant = fixture::grant_log(fixture::tx(1), 0, 5, 7, fixture::ALICE, R"({"title":"Wells"})");
  assert(processor.process(grant) == EventOutcome::Applied);
  assert(processor.process(grant) == EventOutcome::DuplicateSkipped);
  assert(processor.process(grant) == EventOutcome::DuplicateSkipped);

  assert(h.store->count("contract_events") == 1);
  assert(h.store->count("proposals") == 1);
  assert(h.metrics.events_processed_total == 1);
  assert(h.metrics.events_duplicate_total == 2);
}

void test_grant_then_donation() {
  Harness h("processor_end_to_end");
  EventProcessor processor(h.chain, *h.store, h.session, h.metrics);

  std::vector<EventLog> logs = {
      fixture::grant_log(fixture::tx(1), 0, 5, 7, fixture::ALICE,
                         R"({"title":"Clean Water","description":"Wells","budget":"12.5"})"),
      fixture::donation_log(fixture::tx(2), 3, 6, fixture::BOB, "2500000000000000000", 1, 7),
  };
  OutcomeCounts counts = processor.process_all(logs);
  assert(counts.applied == 2);

  auto proposal = h.store->find_proposal(7, h.session.session_id);
  assert(proposal);
  assert(proposal->title == "Clean Water");
  assert(proposal->description == "Wells");
  assert(proposal->funding_goal == "12.500000000000000000");
  assert(proposal->total_donations == "2.500000000000000000");
  assert(proposal->proposer_address == fixture::ALICE);
  assert(proposal->status == "pending");

  auto donations = h.store->query_json(
      "SELECT CAST(amount AS VARCHAR) AS amount, donor_address, round_on_chain_id, tx_hash, log_index FROM donations");
  assert(donations.size() == 1);
  assert(donations[0]["amount"] == "2.500000000000000000");
  assert(donations[0]["donor_address"] == fixture::BOB);
  assert(donations[0]["round_on_chain_id"] == 1);
  assert(donations[0]["log_index"] == 3);

  assert(h.store->count("donors") == 2);
  assert(h.store->count("rounds", "status = 'active'") == 1);
  assert(h.store->count("matching_pools") == 1);

  auto raw = h.store->query_json("SELECT event_type, block_timestamp, decoded_args, proposal_on_chain_id "
                                 "FROM contract_events ORDER BY block_number");
  assert(raw.size() == 2);
  assert(raw[0]["event_type"] == "GrantRegistry.GrantCreated");
  assert(raw[0]["block_timestamp"] == 1700000000 + 5 * 12);
  assert(raw[0]["proposal_on_chain_id"] == 7);
  assert(json::parse(raw[1]["decoded_args"].get<std::string>())["amount"] == "2500000000000000000");
  assert(h.metrics.last_processed_block == 6);
}

void test_regrant_keeps_totals() {
  Harness h("processor_regrant");
  EventProcessor processor(h.chain, *h.store, h.session, h.metrics);

  processor.process(fixture::grant_log(fixture::tx(1), 0, 5, 7, fixture::ALICE, R"({"title":"v1"})"));
  processor.process(fixture::donation_log(fixture::tx(2), 0, 6, fixture::BOB, "1000000000000000000", 1, 7));
  auto before = h.store->find_proposal(7, h.session.session_id);

  // 同一 grant id 的第二个 GrantCreated 只更新元数据
  assert(processor.process(fixture::grant_log(fixture::tx(3), 0, 7, 7, fixture::ALICE, R"({"title":"v2"})")) ==
         EventOutcome::Applied);
  auto after = h.store->find_proposal(7, h.session.session_id);
  assert(after->proposal_id == before->proposal_id);
  assert(after->title == "v2");
  assert(after->total_donations == "1.000000000000000000");
  assert(h.store->count("proposals") == 1);
  assert(h.store->count("rounds") == 1);
}

void test_fixed_id_source() {
  Harness h("processor_ids");
  EventProcessor processor(h.chain, *h.store, h.session, h.metrics);

  int next = 0;
  processor.set_id_source([&next]() {
    std::string n = std::to_string(++next);
    return "00000000-0000-4000-8000-" + std::string(12 - n.size(), '0') + n;
  });

  // donor, pool, round, proposal
  processor.process(fixture::grant_log(fixture::tx(1), 0, 5, 7, fixture::ALICE, "{}"));
  assert(next == 4);
  auto p = h.store->find_proposal(7, h.session.session_id);
  assert(p->proposal_id == "00000000-0000-4000-8000-000000000004");
  assert(p->round_id == "00000000-0000-4000-8000-000000000003");
  assert(h.store->count("donors", "donor_id = '00000000-0000-4000-8000-000000000001'") == 1);
}

void test_unknown_proposal_does_not_abort_batch() {
  Harness h("processor_unknown_target");
  EventProcessor processor(h.chain, *h.store, h.session, h.metrics);

  std::vector<EventLog> logs = {
      fixture::donation_log(fixture::tx(1), 0, 5, fixture::BOB, "1000000000000000000", 1, 99),
      fixture::grant_log(fixture::tx(2), 0, 6, 8, fixture::ALICE, "{}"),
  };
  OutcomeCounts counts = processor.process_all(logs);
  assert(counts.inconsistent == 1);
  assert(counts.applied == 1);

  assert(h.store->count("donations") == 0);
  assert(h.store->count("proposals") == 1);
  // 原始事件照样落库, 重放时是重复
  assert(h.store->count("contract_events") == 2);
  assert(h.metrics.events_inconsistent_total == 1);
  assert(processor.process(logs[0]) == EventOutcome::DuplicateSkipped);
}

void test_processes_in_given_order() {
  Harness h("processor_order");
  EventProcessor processor(h.chain, *h.store, h.session, h.metrics);

  // 捐款排在 grant 前面: 处理器不重排, 捐款找不到 proposal
  std::vector<EventLog> logs = {
      fixture::donation_log(fixture::tx(2), 0, 9, fixture::BOB, "1000000000000000000", 1, 7),
      fixture::grant_log(fixture::tx(1), 0, 5, 7, fixture::ALICE, "{}"),
  };
  OutcomeCounts counts = processor.process_all(logs);
  assert(counts.inconsistent == 1);
  assert(counts.applied == 1);
  assert(h.store->find_proposal(7, h.session.session_id)->total_donations == "0.000000000000000000");
}

void test_concurrent_double_delivery() {
  Harness h("processor_concurrent");
  EventProcessor seed(h.chain, *h.store, h.session, h.metrics);
  assert(seed.process(fixture::grant_log(fixture::tx(1), 0, 5, 7, fixture::ALICE, "{}")) == EventOutcome::Applied);

  for (int round = 0; round < 8; ++round) {
    EventLog donation = fixture::donation_log(fixture::tx(100 + round), 0, 10 + round, fixture::BOB,
                                              "1000000000000000000", 1, 7);
    std::atomic<int> applied{0};
    std::atomic<int> rejected{0};

    auto deliver = [&]() {
      Store store(h.db);
      EventProcessor processor(h.chain, store, h.session, h.metrics);
      try {
        EventOutcome o = processor.process(donation);
        if (o == EventOutcome::Applied)
          ++applied;
        else if (o == EventOutcome::DuplicateSkipped)
          ++rejected;
      } catch (const PersistenceError &) {
        // 事务冲突, 由 tail / backfill 重试
        ++rejected;
      }
    };

    std::thread a(deliver);
    std::thread b(deliver);
    a.join();
    b.join();

    assert(applied == 1);
    assert(rejected == 1);
    assert(h.store->count("contract_events", "tx_hash = '" + donation.tx_hash + "'") == 1);
    assert(h.store->count("donations", "tx_hash = '" + donation.tx_hash + "'") == 1);
  }

  assert(h.store->count("donations") == 8);
  assert(h.store->find_proposal(7, h.session.session_id)->total_donations == "8.000000000000000000");
}

void test_constraint_conflict_is_retried() {
  Harness h("processor_constraint_conflict");
  EventProcessor processor(h.chain, *h.store, h.session, h.metrics);

  assert(processor.process(fixture::grant_log(fixture::tx(1), 0, 5, 7, fixture::ALICE, "{}")) ==
         EventOutcome::Applied);
  assert(processor.process(fixture::donation_log(fixture::tx(2), 0, 6, fixture::BOB, "1000000000000000000", 1, 7)) ==
         EventOutcome::Applied);

  // 与幂等键无关的唯一约束冲突: 日志没落库, 不能算重复
  h.db.execute("CREATE UNIQUE INDEX uq_donations_one_per_proposal ON donations (proposal_id)");
  EventLog second = fixture::donation_log(fixture::tx(3), 0, 7, fixture::BOB, "2000000000000000000", 1, 7);

  bool duplicate_thrown = false;
  bool persistence_thrown = false;
  try {
    processor.process(second);
  } catch (const DuplicateKeyError &) {
    duplicate_thrown = true;
  } catch (const PersistenceError &) {
    persistence_thrown = true;
  }
  assert(!duplicate_thrown);
  assert(persistence_thrown);
  assert(h.metrics.events_duplicate_total == 0);
  assert(h.metrics.events_error_total == 1);
  assert(!h.store->raw_event_exists(second.tx_hash, second.log_index, h.session.session_id));
  assert(h.store->find_proposal(7, h.session.session_id)->total_donations == "1.000000000000000000");

  h.db.execute("DROP INDEX uq_donations_one_per_proposal");
  assert(processor.process(second) == EventOutcome::Applied);
  assert(h.store->count("donations") == 2);
  assert(h.store->find_proposal(7, h.session.session_id)->total_donations == "3.000000000000000000");
}

void test_donor_conflict_between_connections() {
  const std::string carol = "0x90f79bf6eb2c4f870365e785982e1f101e93b906";
  Harness h("processor_donor_conflict");
  EventProcessor processor(h.chain, *h.store, h.session, h.metrics);
  assert(processor.process(fixture::grant_log(fixture::tx(1), 0, 5, 7, fixture::ALICE, "{}")) ==
         EventOutcome::Applied);

  EventLog donation = fixture::donation_log(fixture::tx(2), 0, 6, carol, "1000000000000000000", 1, 7);
  bool stored = false;
  bool other_committed = true;
  {
    // 另一条连接在未提交的事务里先写了同一个 donor
    Store other(h.db);
    Store::Transaction tx(other);
    other.ensure_donor(carol, new_uuid(), carol);

    try {
      // 要么成功, 要么整条重试; 不会是 DuplicateSkipped
      assert(processor.process(donation) == EventOutcome::Applied);
      stored = true;
    } catch (const PersistenceError &) {
      assert(!h.store->raw_event_exists(donation.tx_hash, donation.log_index, h.session.session_id));
    }

    try {
      tx.commit();
    } catch (const PersistenceError &) {
      other_committed = false;
    }
  }
  assert(stored || other_committed);
  assert(h.metrics.events_duplicate_total == 0);

  if (!stored)
    assert(processor.process(donation) == EventOutcome::Applied);
  assert(processor.process(donation) == EventOutcome::DuplicateSkipped);

  assert(h.store->count("donors", "address = '" + carol + "'") == 1);
  assert(h.store->count("donations") == 1);
  assert(h.store->find_proposal(7, h.session.session_id)->total_donations == "1.000000000000000000");
}

void test_block_timestamp_failure_counts_as_error() {
  Harness h("processor_timestamp_failure");
  EventProcessor processor(h.chain, *h.store, h.session, h.metrics);
  EventLog grant = fixture::grant_log(fixture::tx(1), 0, 5, 7, fixture::ALICE, "{}");

  h.chain.fail_get_block = true;
  bool thrown = false;
  try {
    processor.process(grant);
  } catch (const RpcError &) {
    thrown = true;
  }
  assert(thrown);
  assert(h.metrics.events_error_total == 1);
  assert(h.store->count("contract_events") == 0);

  h.chain.fail_get_block = false;
  assert(processor.process(grant) == EventOutcome::Applied);
}

void test_invalid_utf8_args_are_stored() {
  Harness h("processor_invalid_utf8");
  auto path = std::filesystem::temp_directory_path() / "grant-indexer-tests" / "journal_utf8.jsonl";
  std::error_code ec;
  std::filesystem::remove(path, ec);

  EventJournal journal(path.string());
  EventProcessor processor(h.chain, *h.store, h.session, h.metrics, &journal);

  // 已解码但带非法字节的参数: 元数据走默认值, 原始行替换成 U+FFFD
  EventLog grant = fixture::grant_log(fixture::tx(1), 0, 5, 7, fixture::ALICE, "\xff\xfe");
  assert(processor.process(grant) == EventOutcome::Applied);
  assert(h.store->find_proposal(7, h.session.session_id)->title == "Grant 7");

  auto raw = h.store->query_json("SELECT decoded_args FROM contract_events");
  json args = json::parse(raw[0]["decoded_args"].get<std::string>());
  assert(args["metadata"].get<std::string>().find("\xef\xbf\xbd") != std::string::npos);

  std::ifstream in(path);
  std::string line;
  assert(std::getline(in, line));
  assert(json::parse(line)["tx_hash"] == fixture::tx(1));
}

void test_metadata_fallback() {
  Harness h("processor_metadata");
  EventProcessor processor(h.chain, *h.store, h.session, h.metrics);

  processor.process(fixture::grant_log(fixture::tx(1), 0, 5, 9, fixture::ALICE, "not json"));
  auto p = h.store->find_proposal(9, h.session.session_id);
  assert(p->title == "Grant 9");
  assert(p->description == "No metadata");
  assert(p->funding_goal == "0.000000000000000000");

  processor.process(fixture::grant_log(fixture::tx(2), 0, 6, 10, fixture::ALICE, R"({"budget": 3})"));
  p = h.store->find_proposal(10, h.session.session_id);
  assert(p->title == "Grant 10");
  assert(p->description.empty());
  assert(p->funding_goal == "3.000000000000000000");

  auto meta = projection::parse_metadata(11, R"(["a list"])");
  assert(meta.title == "Grant 11");
  assert(projection::decimal_or_zero(json("1e5")) == "0");
  assert(projection::decimal_or_zero(json(-2)) == "0");
  assert(projection::decimal_or_zero(json("0.1234567890123456789")) == "0.123456789012345678");
}

void test_unknown_and_undecodable_logs() {
  Harness h("processor_unknown");
  EventProcessor recording(h.chain, *h.store, h.session, h.metrics);

  EventLog unknown;
  unknown.tx_hash = fixture::tx(1);
  unknown.block_number = 5;
  unknown.contract = contracts::GRANT_REGISTRY;
  unknown.address = fixture::REGISTRY;
  unknown.event_name = "Unknown";
  unknown.args = {{"topics", json::array({"0x01"})}, {"data", "0x"}};
  assert(recording.process(unknown) == EventOutcome::Recorded);
  assert(h.store->count("contract_events", "event_type = 'GrantRegistry.Unknown'") == 1);

  EventProcessor ignoring(h.chain, *h.store, h.session, h.metrics, nullptr, false);
  unknown.tx_hash = fixture::tx(2);
  assert(ignoring.process(unknown) == EventOutcome::Ignored);
  assert(h.store->count("contract_events") == 1);

  EventLog missing = fixture::grant_log(fixture::tx(3), 0, 6, 7, fixture::ALICE, "{}");
  missing.args.erase("owner");
  assert(recording.process(missing) == EventOutcome::DecodeFailed);

  EventLog broken = fixture::donation_log(fixture::tx(4), 0, 6, fixture::BOB, "1", 1, 7);
  broken.decode_error = "ABI data out of bounds at offset 32";
  assert(recording.process(broken) == EventOutcome::DecodeFailed);

  assert(h.metrics.events_decode_error_total == 2);
  assert(h.store->count("contract_events") == 1);
  assert(h.store->count("proposals") == 0);
}

void test_journal_and_metrics() {
  Harness h("processor_journal");
  auto path = std::filesystem::temp_directory_path() / "grant-indexer-tests" / "journal.jsonl";
  std::error_code ec;
  std::filesystem::remove(path, ec);

  {
    EventJournal journal(path.string());
    EventProcessor processor(h.chain, *h.store, h.session, h.metrics, &journal);
    processor.process(fixture::grant_log(fixture::tx(1), 0, 5, 7, fixture::ALICE, "{}"));
    processor.process(fixture::grant_log(fixture::tx(1), 0, 5, 7, fixture::ALICE, "{}"));
    processor.process(fixture::donation_log(fixture::tx(2), 1, 6, fixture::BOB, "5", 1, 7));
  }

  std::ifstream in(path);
  std::vector<json> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(json::parse(line));
  }
  assert(lines.size() == 2);
  assert(lines[0]["contract"] == "GrantRegistry");
  assert(lines[0]["event"] == "GrantCreated");
  assert(lines[0]["session_id"] == h.session.session_id);
  assert(lines[0]["timestamp"] == "2023-11-14T22:14:20Z");
  assert(lines[1]["args"]["amount"] == "5");
  assert(lines[1]["log_index"] == 1);

  std::string text = h.metrics.render_prometheus();
  assert(text.find("events_processed_total 2\n") != std::string::npos);
  assert(text.find("events_duplicate_total 1\n") != std::string::npos);
  assert(text.find("last_processed_block 6\n") != std::string::npos);
  assert(text.find("event_processing_duration_seconds_count 3\n") != std::string::npos);
}

} // namespace

int main() {
  test_idempotent_processing();
  test_grant_then_donation();
  test_regrant_keeps_totals();
  test_fixed_id_source();
  test_unknown_proposal_does_not_abort_batch();
  test_processes_in_given_order();
  test_concurrent_double_delivery();
  test_constraint_conflict_is_retried();
  test_donor_conflict_between_connections();
  test_block_timestamp_failure_counts_as_error();
  test_invalid_utf8_args_are_stored();
  test_metadata_fallback();
  test_unknown_and_undecodable_logs();
  test_journal_and_metrics();

  std::cout << "test_processor passed\n";
  return 0;
}
