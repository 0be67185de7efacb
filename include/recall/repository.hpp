#pragma once

#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "recall/common.hpp"
#include "recall/conversation.hpp"
#include "recall/errors.hpp"
#include "recall/memory.hpp"

namespace recall {

inline json record_to_json(const MemoryRecord& r) {
  return json{{"id", r.id},
              {"text", r.text},
              {"embedding", r.embedding},
              {"kind", kind_name(r.kind)},
              {"importance", r.importance},
              {"created_at", r.created_at},
              {"last_accessed_at", r.last_accessed_at},
              {"source_ids", r.source_ids}};
}

inline MemoryRecord record_from_json(const json& row) {
  MemoryRecord r;
  try {
    r.id = row.at("id").get<uint64_t>();
    r.text = row.at("text").get<std::string>();
    r.embedding = row.at("embedding").get<std::vector<float>>();
    const auto kind = parse_kind(row.at("kind").get<std::string>());
    if (!kind.has_value()) {
      throw InvalidRecord("unknown kind '" + row.at("kind").get<std::string>() + "'");
    }
    r.kind = *kind;
    r.importance = row.at("importance").get<int>();
    r.created_at = row.at("created_at").get<int64_t>();
    r.last_accessed_at = row.at("last_accessed_at").get<int64_t>();
    r.source_ids = row.value("source_ids", std::vector<uint64_t>{});
  } catch (const json::exception& e) {
    throw InvalidRecord(std::string("malformed row: ") + e.what());
  }
  return r;
}

// Stores each identity as JSON lines under one directory:
//   <identity>.memory.jsonl      metadata line, then one record per line
//   <identity>.transcript.jsonl  one conversation entry per line
class MemoryRepository {
 public:
  explicit MemoryRepository(fs::path dir) : dir_(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
  }

  bool save_stream(const std::string& identity, const MemoryStream& stream) const {
    std::ostringstream out;
    const json meta = {{"_type", "metadata"},
                       {"identity", identity},
                       {"next_id", stream.next_id()},
                       {"updated_at", now_iso8601()}};
    out << dump_row(meta) << "\n";
    stream.visit([&](const MemoryRecord& r) { out << dump_row(record_to_json(r)) << "\n"; });
    return write_atomically(memory_path(identity), out.str());
  }

  // Empty stream when nothing was saved yet. Throws InvalidRecord on any
  // unreadable or inconsistent row.
  void load_stream(const std::string& identity, MemoryStream* stream) const {
    const fs::path path = memory_path(identity);
    if (!fs::exists(path)) {
      return;
    }
    std::ifstream in(path);
    if (!in) {
      throw InvalidRecord("cannot open " + path.string());
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
      ++line_no;
      line = trim(line);
      if (line.empty()) {
        continue;
      }
      json row;
      try {
        row = json::parse(line);
      } catch (const json::exception& e) {
        throw InvalidRecord(path.filename().string() + ":" + std::to_string(line_no) + ": " + e.what());
      }
      if (!row.is_object()) {
        throw InvalidRecord(path.filename().string() + ":" + std::to_string(line_no) + ": not an object");
      }
      if (row.value("_type", "") == "metadata") {
        const std::string owner = row.value("identity", identity);
        if (owner != identity) {
          throw InvalidRecord(path.filename().string() + " belongs to '" + owner + "', not '" + identity + "'");
        }
        continue;
      }
      stream->restore(record_from_json(row));
    }
  }

  bool save_transcript(const std::string& identity, const ConversationBuffer& buffer) const {
    std::ostringstream out;
    for (const auto& e : buffer.entries()) {
      out << dump_row(json{{"speaker", e.speaker}, {"text", e.text}, {"timestamp", e.timestamp}}) << "\n";
    }
    return write_atomically(transcript_path(identity), out.str());
  }

  // Transcript rows are a convenience copy; unreadable ones are skipped.
  void load_transcript(const std::string& identity, ConversationBuffer* buffer) const {
    std::ifstream in(transcript_path(identity));
    if (!in) {
      return;
    }
    std::string line;
    while (std::getline(in, line)) {
      line = trim(line);
      if (line.empty()) {
        continue;
      }
      try {
        const json row = json::parse(line);
        if (!row.is_object()) {
          continue;
        }
        buffer->add(row.value("speaker", ""), row.value("text", ""), row.value("timestamp", int64_t{0}));
      } catch (const json::exception& e) {
        Logger::log(Logger::Level::kWarn, "Skipping transcript row for " + identity + ": " + e.what());
      }
    }
  }

  std::vector<std::string> identities() const {
    std::vector<std::string> out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
      const std::string name = entry.path().filename().string();
      const std::string suffix = ".memory.jsonl";
      if (name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        if (const auto identity = decode_name(name.substr(0, name.size() - suffix.size()))) {
          out.push_back(*identity);
        }
      }
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  fs::path memory_path(const std::string& identity) const { return dir_ / (safe_name(identity) + ".memory.jsonl"); }

  fs::path transcript_path(const std::string& identity) const {
    return dir_ / (safe_name(identity) + ".transcript.jsonl");
  }

  const fs::path& dir() const { return dir_; }

 private:
  // Bytes outside [A-Za-z0-9_-] become %XX, so distinct identities never share
  // a file. The empty identity is a lone "%".
  static std::string safe_name(const std::string& key) {
    if (key.empty()) {
      return "%";
    }
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string safe;
    safe.reserve(key.size());
    for (char c : key) {
      const auto b = static_cast<unsigned char>(c);
      if (std::isalnum(b) || c == '_' || c == '-') {
        safe.push_back(c);
      } else {
        safe.push_back('%');
        safe.push_back(hex[b >> 4]);
        safe.push_back(hex[b & 0x0F]);
      }
    }
    return safe;
  }

  static std::optional<std::string> decode_name(const std::string& name) {
    if (name == "%") {
      return std::string();
    }
    auto nibble = [](char c) -> int {
      if (c >= '0' && c <= '9') {
        return c - '0';
      }
      if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
      }
      return -1;
    };
    std::string out;
    for (std::size_t i = 0; i < name.size(); ++i) {
      if (name[i] != '%') {
        out.push_back(name[i]);
        continue;
      }
      if (i + 2 >= name.size()) {
        return std::nullopt;
      }
      const int hi = nibble(name[i + 1]);
      const int lo = nibble(name[i + 2]);
      if (hi < 0 || lo < 0) {
        return std::nullopt;
      }
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    }
    if (out.empty() || safe_name(out) != name) {
      return std::nullopt;
    }
    return out;
  }

  // Invalid UTF-8 is written as U+FFFD instead of failing the whole file.
  static std::string dump_row(const json& row) { return row.dump(-1, ' ', false, json::error_handler_t::replace); }

  static bool write_atomically(const fs::path& path, const std::string& content) {
    const fs::path tmp = path.string() + ".tmp";
    if (!write_text_file(tmp, content)) {
      Logger::log(Logger::Level::kError, "Cannot write " + tmp.string());
      return false;
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
      Logger::log(Logger::Level::kError, "Cannot replace " + path.string() + ": " + ec.message());
      return false;
    }
    return true;
  }

  fs::path dir_;
};

}  // namespace recall
