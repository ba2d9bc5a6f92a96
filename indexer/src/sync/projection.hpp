#pragma once

// ============================================================================
// 投影: 纯函数 (payload, 上下文, 当前状态) -> 变更列表
// 读状态和落库都在 EventProcessor 的同一个事务里
// ============================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/events.hpp"
#include "../core/store.hpp"

using json = nlohmann::json;

namespace projection {

constexpr int64_t ROUND_DURATION_SECONDS = 30LL * 24 * 3600;

struct Context {
  std::string session_id;
  std::string tx_hash;
  int64_t log_index = 0;
  int64_t block_timestamp = 0;
  std::function<std::string()> new_id = new_uuid;
};

struct State {
  std::optional<ProposalRow> proposal;
  std::optional<RoundRow> active_round;
};

struct EnsureDonor {
  std::string address;
  std::string donor_id;
  std::string username;
};

struct OpenRound {
  RoundRow round;
};

struct UpsertProposal {
  ProposalRow proposal;
};

struct InsertDonation {
  DonationRow donation;
};

struct AddToProposalTotal {
  std::string proposal_id;
  std::string amount;
};

using Mutation = std::variant<EnsureDonor, OpenRound, UpsertProposal, InsertDonation, AddToProposalTotal>;

struct Mutations {
  std::vector<Mutation> items;
  std::optional<std::string> warning; // 一致性问题, 此时只建 donor, 不写捐款
  std::optional<int64_t> proposal_on_chain_id;
};

// ----------------------------------------------------------------------------
// metadata
// ----------------------------------------------------------------------------

struct GrantMetadata {
  std::string title;
  std::string description;
  std::string budget = "0";
};

// 非负十进制文本, 最多 20 位整数 18 位小数, 否则 "0"
inline std::string decimal_or_zero(const json &v) {
  std::string s;
  if (v.is_number_unsigned()) {
    s = std::to_string(v.get<uint64_t>());
  } else if (v.is_number_integer()) {
    s = std::to_string(v.get<int64_t>());
  } else if (v.is_number_float() || v.is_string()) {
    s = v.is_string() ? v.get<std::string>() : v.dump();
  } else {
    return "0";
  }

  size_t dot = s.find('.');
  std::string integer = s.substr(0, dot);
  std::string fraction = dot == std::string::npos ? "" : s.substr(dot + 1);
  auto digits = [](const std::string &x) {
    return std::all_of(x.begin(), x.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
  };
  if (integer.empty() || !digits(integer) || !digits(fraction) || integer.size() > payload::MAX_INTEGER_DIGITS)
    return "0";
  if (fraction.size() > static_cast<size_t>(payload::WEI_DECIMALS))
    fraction.resize(payload::WEI_DECIMALS);
  return fraction.empty() ? integer : integer + "." + fraction;
}

inline GrantMetadata parse_metadata(int64_t grant_id, const std::string &raw) {
  GrantMetadata m;
  std::string fallback_title = "Grant " + std::to_string(grant_id);

  json j = json::parse(raw, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    m.title = fallback_title;
    m.description = "No metadata";
    return m;
  }

  m.title = j.contains("title") && j["title"].is_string() ? j["title"].get<std::string>() : fallback_title;
  m.description = j.contains("description") && j["description"].is_string() ? j["description"].get<std::string>() : "";
  if (j.contains("budget"))
    m.budget = decimal_or_zero(j["budget"]);
  return m;
}

// ----------------------------------------------------------------------------
// handlers
// ----------------------------------------------------------------------------

inline Mutations on_event(const GrantCreated &ev, const Context &ctx, const State &state) {
  Mutations out;
  out.proposal_on_chain_id = ev.grant_id;

  out.items.push_back(EnsureDonor{ev.owner, ctx.new_id(), ev.owner});

  std::string round_id;
  if (state.active_round) {
    round_id = state.active_round->round_id;
  } else {
    RoundRow round;
    round.pool_id = ctx.new_id();
    round.round_id = ctx.new_id();
    round.start_epoch = ctx.block_timestamp;
    round.end_epoch = ctx.block_timestamp + ROUND_DURATION_SECONDS;
    round_id = round.round_id;
    out.items.push_back(OpenRound{round});
  }

  GrantMetadata meta = parse_metadata(ev.grant_id, ev.metadata);
  ProposalRow p;
  p.proposal_id = state.proposal ? state.proposal->proposal_id : ctx.new_id();
  p.on_chain_id = ev.grant_id;
  p.session_id = ctx.session_id;
  p.proposer_address = ev.owner;
  p.round_id = round_id;
  p.title = meta.title;
  p.description = meta.description;
  p.status = "pending";
  p.funding_goal = meta.budget;
  out.items.push_back(UpsertProposal{p});
  return out;
}

inline Mutations on_event(const DonationReceived &ev, const Context &ctx, const State &state) {
  Mutations out;
  out.proposal_on_chain_id = ev.grant_id;

  out.items.push_back(EnsureDonor{ev.donor, ctx.new_id(), ev.donor});

  if (!state.proposal) {
    out.warning = "donation for unknown proposal " + std::to_string(ev.grant_id);
    return out;
  }

  DonationRow d;
  d.donation_id = ctx.new_id();
  d.session_id = ctx.session_id;
  d.proposal_id = state.proposal->proposal_id;
  d.on_chain_grant_id = ev.grant_id;
  d.donor_address = ev.donor;
  d.token_address = ev.token;
  d.round_on_chain_id = ev.round_id;
  d.amount = ev.amount_eth;
  d.description = "On-chain donation to Grant " + std::to_string(ev.grant_id);
  d.tx_hash = ctx.tx_hash;
  d.log_index = ctx.log_index;
  out.items.push_back(InsertDonation{d});
  out.items.push_back(AddToProposalTotal{d.proposal_id, ev.amount_eth});
  return out;
}

// 新增 payload 类型而没有对应 on_event() 重载时这里编译失败
inline Mutations project(const EventPayload &ev, const Context &ctx, const State &state) {
  return std::visit([&](const auto &e) { return on_event(e, ctx, state); }, ev);
}

// ----------------------------------------------------------------------------
// 读状态 / 落库
// ----------------------------------------------------------------------------

inline State load_state(Store &store, const EventPayload &ev, const std::string &session_id) {
  State state;
  if (const auto *g = std::get_if<GrantCreated>(&ev)) {
    state.proposal = store.find_proposal(g->grant_id, session_id);
    state.active_round = store.find_active_round();
  } else if (const auto *d = std::get_if<DonationReceived>(&ev)) {
    state.proposal = store.find_proposal(d->grant_id, session_id);
  }
  return state;
}

struct MutationApplier {
  Store &store;

  void operator()(const EnsureDonor &m) const { store.ensure_donor(m.address, m.donor_id, m.username); }
  void operator()(const OpenRound &m) const { store.open_round(m.round); }
  void operator()(const UpsertProposal &m) const { store.upsert_proposal(m.proposal); }
  void operator()(const InsertDonation &m) const { store.insert_donation(m.donation); }
  void operator()(const AddToProposalTotal &m) const { store.add_to_proposal_total(m.proposal_id, m.amount); }
};

inline void apply(Store &store, const Mutations &mutations) {
  MutationApplier applier{store};
  for (const auto &m : mutations.items) {
    std::visit(applier, m);
  }
}

} // namespace projection
