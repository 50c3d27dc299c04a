#include "csvmap/token_jsonl_simdjson.hpp"

#include <simdjson.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cm {

static std::string_view trim_right(std::string_view s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n'))
    s.remove_suffix(1);
  return s;
}

static std::string_view copy_capped(Arena& arena, std::string_view s, size_t cap) {
  if (s.size() <= cap) return arena.copy(s);
  if (cap <= 3) return arena.copy(s.substr(0, cap));
  std::string out; out.reserve(cap);
  out.append(s.substr(0, cap - 3));
  out.append("...");
  return arena.copy(out);
}

struct JsonlTokenizer::Impl {
  JsonlConfig cfg;
  Arena header_arena{4 * 1024}; // owns header keys for the whole run
  Arena row_arena{64 * 1024};   // per-line values

  Row header;
  bool header_emitted = false; // the header row may be empty
  Row fields;
  std::vector<std::pair<std::string_view, std::string_view>> kvs;

  explicit Impl(const JsonlConfig& c) : cfg(c) {}

  // Cell text for one value; numbers keep their literal spelling.
  std::string_view cell_of(simdjson::ondemand::value v) {
    switch (v.type()) {
      case simdjson::ondemand::json_type::number: {
        std::string_view tok = v.raw_json_token();
        return row_arena.copy(trim_right(tok));
      }
      case simdjson::ondemand::json_type::string: {
        std::string_view s = v.get_string();
        return row_arena.copy(s);
      }
      case simdjson::ondemand::json_type::boolean: {
        bool b = v.get_bool();
        return b ? std::string_view("true") : std::string_view("false");
      }
      case simdjson::ondemand::json_type::null:
        return std::string_view{};
      default: {
        // arrays/objects: cap their raw text
        std::string_view raw = simdjson::to_json_string(v);
        return copy_capped(row_arena, trim_right(raw), cfg.cap_nested_value_bytes);
      }
    }
  }
};

JsonlTokenizer::JsonlTokenizer(const JsonlConfig& cfg) : p_(new Impl(cfg)) {}

JsonlTokenizer::~JsonlTokenizer() { delete p_; }

const Row& JsonlTokenizer::header() const { return p_->header; }

bool JsonlTokenizer::feed_line(std::string_view line, const RowCallback& on_row) {
  if (trim_right(line).empty()) return true;

  p_->row_arena.reset();
  p_->fields.clear();
  p_->kvs.clear();

  // thread-local scratch and parser
  thread_local simdjson::ondemand::parser parser;
  thread_local std::string scratch;

  scratch.assign(line.data(), line.size());
  scratch.resize(line.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(scratch.data(), line.size(), scratch.size());

  try {
    simdjson::ondemand::document doc = parser.iterate(view);
    simdjson::ondemand::json_type t = doc.type();
    if (t != simdjson::ondemand::json_type::object) {
      err_ = "JSONL: non-object line";
      return false;
    }

    const bool first = !p_->header_emitted;
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view key = field.unescaped_key();
      std::string_view ksv = first ? p_->header_arena.copy(key) : p_->row_arena.copy(key);
      if (first) p_->header.push_back(ksv); // first object fixes header order
      p_->kvs.emplace_back(ksv, p_->cell_of(field.value()));
    }
    if (!doc.at_end()) {
      err_ = "JSONL: trailing content after object";
      return false;
    }

    // Align values by header order
    p_->fields.reserve(p_->header.size());
    for (auto hk : p_->header) {
      std::string_view val{};
      for (auto& kv : p_->kvs) if (kv.first == hk) { val = kv.second; break; }
      p_->fields.push_back(val);
    }

    if (first) {
      on_row(p_->header);
      p_->header_emitted = true;
    }
    on_row(p_->fields);
    return true;

  } catch (const simdjson::simdjson_error& e) {
    err_ = std::string("JSONL: ") + e.what();
    return false;
  }
}

}
