#include <xpii/schema/encoding/scale/audit_entry.hpp>

#include <iterator>
#include <tuple>
#include <utility>
#include <vector>

using namespace xpii::schema;

namespace xpii::schema::encoding::scale {

namespace {

using context_pairs_t = std::vector<std::tuple<std::string, context_value_t>>;

}  // namespace

void encode(audit_entry<1>&& o, ::scale::Encoder& encoder) {
  auto context = context_pairs_t{std::begin(o.context), std::end(o.context)};
  encode(o.version, encoder);
  encode(o.seq, encoder);
  encode(o.timestamp, encoder);
  encode(o.agent_id, encoder);
  encode(o.action, encoder);
  encode(context, encoder);
  encode(o.outcome, encoder);
  encode(o.prev_hash, encoder);
  encode(o.entry_hash, encoder);
}

void decode(audit_entry<1>&& o, ::scale::Decoder& decoder) {
  auto context = context_pairs_t{};
  decode(o.version, decoder);
  decode(o.seq, decoder);
  decode(o.timestamp, decoder);
  decode(o.agent_id, decoder);
  decode(o.action, decoder);
  decode(context, decoder);
  decode(o.outcome, decoder);
  decode(o.prev_hash, decoder);
  decode(o.entry_hash, decoder);
  o.context.clear();
  for (auto& [key, value] : context) {
    o.context.emplace(std::move(key), std::move(value));
  }
}

}  // namespace xpii::schema::encoding::scale
