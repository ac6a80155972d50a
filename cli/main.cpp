/**
 * @file main.cpp
 * @brief xtoc-cli - Linux one-shot runner around the XTOC protocol engine.
 *
 * Responsibilities:
 *  - Parse CLI subcommands (CLI11): encode, decode, chunk, reassemble, profiles, id.
 *  - Keep a small JSON config under XDG (~/.config/altgrid/xtoc-cli/config.json)
 *    holding the default transport profile and output format.
 *  - Convert JSON field objects to/from typed payloads (nlohmann::json).
 *  - Print results as pretty text, JSON, or raw wrapper lines.
 *
 * Examples:
 *   xtoc-cli encode sitrep --fields '{"src":12,"pri":2,"note":"all quiet"}' --profile JS8Call
 *   xtoc-cli chunk --line 'X1.1.C.7KQ2M9TA.1/1.AQAM...' --max-chars 50
 *   xtoc-cli decode < received.txt
 *   xtoc-cli profiles
 *
 * Notes:
 *  - Errors go to stderr as "status=error reason=<...>" lines; exit code 2.
 *  - Secure (S) packets are framed and reassembled, never decrypted here.
 *  - Config file: {"profile":"CopyPaste","format":"pretty"}; flags override it.
 */

#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <iterator>
#include <type_traits>
#include <variant>

#include <unistd.h> // isatty

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "xtoc/chunker.hpp"
#include "xtoc/describe.hpp"
#include "xtoc/packet.hpp"
#include "xtoc/reassembler.hpp"
#include "xtoc/secure_envelope.hpp"
#include "xtoc/template_codec.hpp"
#include "xtoc/transport_profile.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace xtoc;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static void log_error(const std::string& reason) {
  std::cerr << "status=error reason=" << reason << "\n";
}

static int fail(ErrorCode rc, const std::string& what) {
  log_error(std::string(to_string(rc)) + " detail=\"" + what + "\"");
  return 2;
}

static std::string to_lower_ascii(std::string s) {
  for (char& c: s) if (c>='A' && c<='Z') c = char(c - 'A' + 'a');
  return s;
}

static int64_t now_ms_system() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

static std::string read_all_stdin() {
  return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

// ---------- config ----------

static fs::path default_config_dir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                : fs::path(home ? home : ".") / ".config";
  return base / "altgrid" / "xtoc-cli";
}

static json read_json_file(const fs::path& p) {
  try {
    if (!fs::exists(p)) return json::object();
    std::ifstream in(p);
    if (!in) return json::object();
    json j; in >> j; return j;
  } catch (const json::exception& e) {
    log_error(std::string("config_unreadable path=") + p.string() + " detail=\"" + e.what() + "\"");
    return json::object();
  } catch (const fs::filesystem_error& e) {
    log_error(std::string("config_unreadable path=") + p.string() + " detail=\"" + e.what() + "\"");
    return json::object();
  }
}

static bool atomic_write_json(const fs::path& p, const json& j) {
  try {
    fs::create_directories(p.parent_path());
    auto tmp = p; tmp += ".tmp";
    {
      std::ofstream out(tmp, std::ios::trunc);
      if (!out) return false;
      out << j.dump(2);
      out.flush();
      out.close();
    }
    fs::rename(tmp, p);
    return true;
  } catch (const fs::filesystem_error& e) {
    log_error(std::string("config_unwritable path=") + p.string() + " detail=\"" + e.what() + "\"");
    return false;
  }
}

struct CliConfig {
  std::string profile{"CopyPaste"};
  std::string format{"pretty"};
};

// Load config.json, creating it with defaults on first run.
static CliConfig load_config(const fs::path& dir) {
  CliConfig cfg;
  const fs::path file = dir / "config.json";
  json j = read_json_file(file);

  if (j.contains("profile") && j["profile"].is_string()) cfg.profile = j["profile"].get<std::string>();
  if (j.contains("format") && j["format"].is_string())   cfg.format  = j["format"].get<std::string>();

  if (!profile_from_name(cfg.profile)) {
    log_error("config_bad_profile value=" + cfg.profile);
    cfg.profile = to_string(DEFAULT_PROFILE);
  }

  if (!j.contains("profile") || !j.contains("format")) {
    json out;
    out["profile"] = cfg.profile;
    out["format"] = cfg.format;
    if (!atomic_write_json(file, out)) log_error("config_not_saved path=" + file.string());
  }
  return cfg;
}

// ---------- template names ----------

static std::optional<TemplateKind> template_from_arg(const std::string& arg) {
  const std::string a = to_lower_ascii(arg);
  for (uint32_t id = 1; id <= 8; ++id) {
    const auto kind = template_kind_from_id(id);
    if (!kind) continue;
    if (a == to_lower_ascii(to_string(*kind)) || a == std::to_string(id)) return kind;
  }
  if (a == "loc" || a == "checkin_loc") return TemplateKind::CheckinLoc;
  return std::nullopt;
}

// ---------- JSON <-> payload ----------

static std::vector<int64_t> ids_from(const json& j, const char* key) {
  std::vector<int64_t> out;
  if (!j.contains(key) || !j[key].is_array()) return out;
  for (const auto& v : j[key]) {
    if (v.is_number_integer()) out.push_back(v.get<int64_t>());
  }
  return out;
}

static GeoPoint point_from(const json& j) {
  GeoPoint p;
  p.lat = j.value("lat", 0.0);
  p.lon = j.value("lon", 0.0);
  return p;
}

static std::optional<GeoPoint> loc_from(const json& j) {
  if (!j.contains("lat") || !j.contains("lon")) return std::nullopt;
  return point_from(j);
}

static ErrorCode payload_from_json(TemplateKind kind, const json& j, int64_t now_ms, PacketPayload& out) {
  const int64_t t = j.value("t", now_ms);
  switch (kind) {
    case TemplateKind::CheckinLoc: {
      CheckinLocPayload p;
      p.unit_id = j.value("unitId", int64_t{0});
      p.unit_ids = ids_from(j, "unitIds");
      p.lat = j.value("lat", 0.0);
      p.lon = j.value("lon", 0.0);
      p.t_ms = t;
      p.status = j.value("status", 0);
      out = p;
      return ErrorCode::Ok;
    }
    case TemplateKind::Sitrep: {
      SitrepPayload p;
      p.src = j.value("src", int64_t{0});
      p.src_ids = ids_from(j, "srcIds");
      p.dst = j.value("dst", int64_t{0});
      p.pri = j.value("pri", 0);
      p.status = j.value("status", 0);
      p.t_ms = t;
      p.loc = loc_from(j);
      p.note = j.value("note", std::string());
      out = p;
      return ErrorCode::Ok;
    }
    case TemplateKind::Contact: {
      ContactPayload p;
      p.src = j.value("src", int64_t{0});
      p.src_ids = ids_from(j, "srcIds");
      p.pri = j.value("pri", 0);
      p.t_ms = t;
      p.type_code = j.value("typeCode", 0);
      p.count = j.value("count", int64_t{0});
      p.dir = j.value("dir", 0);
      p.loc = loc_from(j);
      p.note = j.value("note", std::string());
      out = p;
      return ErrorCode::Ok;
    }
    case TemplateKind::Task: {
      TaskPayload p;
      p.src = j.value("src", int64_t{0});
      p.src_ids = ids_from(j, "srcIds");
      p.dst = j.value("dst", int64_t{0});
      p.pri = j.value("pri", 0);
      p.t_ms = t;
      p.action_code = j.value("actionCode", 0);
      p.due_mins = j.value("dueMins", int64_t{0});
      p.loc = loc_from(j);
      p.note = j.value("note", std::string());
      out = p;
      return ErrorCode::Ok;
    }
    case TemplateKind::Resource: {
      ResourcePayload p;
      p.src = j.value("src", int64_t{0});
      p.src_ids = ids_from(j, "srcIds");
      p.pri = j.value("pri", 0);
      p.t_ms = t;
      p.item_code = j.value("itemCode", 0);
      p.qty = j.value("qty", int64_t{0});
      p.loc = loc_from(j);
      p.note = j.value("note", std::string());
      out = p;
      return ErrorCode::Ok;
    }
    case TemplateKind::Asset: {
      AssetPayload p;
      p.src = j.value("src", int64_t{0});
      p.src_ids = ids_from(j, "srcIds");
      p.condition = j.value("condition", 0);
      p.t_ms = t;
      p.type_code = j.value("typeCode", 0);
      p.loc = loc_from(j);
      p.label = j.value("label", std::string());
      p.note = j.value("note", std::string());
      out = p;
      return ErrorCode::Ok;
    }
    case TemplateKind::Zone: {
      ZonePayload p;
      p.src = j.value("src", int64_t{0});
      p.src_ids = ids_from(j, "srcIds");
      p.threat = j.value("threat", 0);
      p.meaning_code = j.value("meaningCode", 0);
      p.t_ms = t;
      p.label = j.value("label", std::string());
      p.note = j.value("note", std::string());
      if (j.contains("circle") && j["circle"].is_object()) {
        const json& c = j["circle"];
        ZoneCircle zc;
        zc.center = point_from(c);
        zc.radius_m = c.value("radiusM", 0.0);
        p.circle = zc;
      } else if (j.contains("points") && j["points"].is_array()) {
        for (const auto& pt : j["points"]) p.polygon.push_back(point_from(pt));
      }
      out = p;
      return ErrorCode::Ok;
    }
    case TemplateKind::Mission:
      break;
  }
  return ErrorCode::UnsupportedTemplate;
}

static json loc_json(const std::optional<GeoPoint>& loc) {
  if (!loc) return nullptr;
  return json{{"lat", loc->lat}, {"lon", loc->lon}};
}

static json payload_to_json(const PacketPayload& payload) {
  json j;
  j["template"] = to_string(kind_of(payload));
  j["t"] = time_of(payload);
  std::visit([&j](const auto& p) {
    using P = std::decay_t<decltype(p)>;
    if constexpr (std::is_same_v<P, CheckinLocPayload>) {
      j["unitId"] = p.unit_id;
      if (!p.unit_ids.empty()) j["unitIds"] = p.unit_ids;
      j["lat"] = p.lat;
      j["lon"] = p.lon;
      j["status"] = p.status;
    } else {
      j["src"] = p.src;
      if (!p.src_ids.empty()) j["srcIds"] = p.src_ids;
      if constexpr (std::is_same_v<P, SitrepPayload>) {
        j["dst"] = p.dst; j["pri"] = p.pri; j["status"] = p.status;
      } else if constexpr (std::is_same_v<P, ContactPayload>) {
        j["pri"] = p.pri; j["typeCode"] = p.type_code; j["count"] = p.count; j["dir"] = p.dir;
      } else if constexpr (std::is_same_v<P, TaskPayload>) {
        j["dst"] = p.dst; j["pri"] = p.pri; j["actionCode"] = p.action_code; j["dueMins"] = p.due_mins;
      } else if constexpr (std::is_same_v<P, ResourcePayload>) {
        j["pri"] = p.pri; j["itemCode"] = p.item_code; j["qty"] = p.qty;
      } else if constexpr (std::is_same_v<P, AssetPayload>) {
        j["condition"] = p.condition; j["typeCode"] = p.type_code;
        if (!p.label.empty()) j["label"] = p.label;
      } else if constexpr (std::is_same_v<P, ZonePayload>) {
        j["threat"] = p.threat; j["meaningCode"] = p.meaning_code;
        if (!p.label.empty()) j["label"] = p.label;
        if (p.circle) {
          j["circle"] = {{"lat", p.circle->center.lat}, {"lon", p.circle->center.lon},
                         {"radiusM", p.circle->radius_m}};
        } else {
          json pts = json::array();
          for (const auto& pt : p.polygon) pts.push_back({{"lat", pt.lat}, {"lon", pt.lon}});
          j["points"] = pts;
        }
      }
      if constexpr (!std::is_same_v<P, ZonePayload>) {
        if (p.loc) j["loc"] = loc_json(p.loc);
      }
      if (!p.note.empty()) j["note"] = p.note;
    }
  }, payload);
  return j;
}

static json packet_to_json(const FramedPacket& p) {
  json j;
  j["templateId"] = p.template_id;
  j["mode"] = std::string(1, p.mode_char());
  j["id"] = p.id;
  j["part"] = p.part;
  j["total"] = p.total;
  if (p.is_secure()) j["kid"] = p.kid();
  j["payload"] = p.payload;
  j["raw"] = p.raw;
  return j;
}

// ---------- output ----------

static void print_lines(const std::vector<std::string>& lines, const std::string& format, const Ansi& ansi) {
  if (format == "json") {
    std::cout << json(lines).dump(2) << "\n";
    return;
  }
  if (format == "raw") {
    for (const auto& l : lines) std::cout << l << "\n";
    return;
  }
  std::cout << ansi.bold(std::to_string(lines.size()) + " line(s)") << "\n";
  for (size_t i = 0; i < lines.size(); ++i) {
    std::cout << "  " << ansi.dim("#" + std::to_string(i + 1)) << " "
              << std::setw(4) << lines[i].size() << "  " << lines[i] << "\n";
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  // CLI-centered options
  std::string opt_format;
  bool opt_no_color = false;
  std::string opt_config_dir;

  CLI::App app{"XTOC packet tool"};
  app.require_subcommand(1);
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")->check(CLI::IsMember({"pretty","json","raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_option("--config-dir", opt_config_dir, "Override config directory");

  // encode
  std::string enc_template;
  std::string enc_fields = "{}";
  std::string enc_id;
  std::string enc_profile;
  size_t enc_max_chars = 0;
  auto* cmd_encode = app.add_subcommand("encode", "Encode a template from JSON fields");
  cmd_encode->add_option("template", enc_template, "Template name or id (sitrep, 4, zone ...)")->required();
  cmd_encode->add_option("--fields", enc_fields, "JSON object of template fields");
  cmd_encode->add_option("--id", enc_id, "Packet id (random if omitted)");
  cmd_encode->add_option("--profile", enc_profile, "Transport profile for chunking");
  cmd_encode->add_option("--max-chars", enc_max_chars, "Explicit per-line budget (overrides profile)");

  // decode
  std::string dec_line;
  auto* cmd_decode = app.add_subcommand("decode", "Reassemble and decode wrapper lines (stdin if no --line)");
  cmd_decode->add_option("--line", dec_line, "Single wrapper line");

  // chunk
  std::string chk_line;
  std::string chk_profile;
  size_t chk_max_chars = 0;
  auto* cmd_chunk = app.add_subcommand("chunk", "Split a 1/1 wrapper line for a transport");
  cmd_chunk->add_option("--line", chk_line, "Wrapper line")->required();
  cmd_chunk->add_option("--profile", chk_profile, "Transport profile");
  cmd_chunk->add_option("--max-chars", chk_max_chars, "Explicit per-line budget (overrides profile)");

  // reassemble
  auto* cmd_reassemble = app.add_subcommand("reassemble", "Rebuild one wrapper from chunk lines on stdin");

  // profiles
  auto* cmd_profiles = app.add_subcommand("profiles", "List transport profiles and budgets");

  // id
  size_t id_len = PACKET_ID_LEN;
  auto* cmd_id = app.add_subcommand("id", "Generate a packet id");
  cmd_id->add_option("--len", id_len, "Id length")->check(CLI::Range(size_t{1}, size_t{32}));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  // Resolve config dir and load (created on first run)
  fs::path config_dir = opt_config_dir.empty() ? default_config_dir() : fs::path(opt_config_dir);
  CliConfig cfg = load_config(config_dir);
  const std::string format = opt_format.empty() ? cfg.format : opt_format;

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && (format=="pretty");

  auto budget_for = [&cfg](const std::string& profile, size_t explicit_max) -> std::optional<size_t> {
    if (explicit_max > 0) return explicit_max;
    const std::string name = profile.empty() ? cfg.profile : profile;
    if (!profile_from_name(name)) return std::nullopt;   // typo on the command line: refuse, no fallback
    return max_chars_for(name);
  };

  // ---- encode ----
  if (*cmd_encode) {
    const auto kind = template_from_arg(enc_template);
    if (!kind) return fail(ErrorCode::UnsupportedTemplate, enc_template);

    json fields;
    try {
      fields = json::parse(enc_fields);
    } catch (const json::parse_error& e) {
      log_error(std::string("bad_fields detail=\"") + e.what() + "\"");
      return 2;
    }
    if (!fields.is_object()) {
      log_error("bad_fields detail=\"expected a JSON object\"");
      return 2;
    }

    PacketPayload payload;
    ErrorCode rc = ErrorCode::Ok;
    try {
      rc = payload_from_json(*kind, fields, now_ms_system(), payload);
    } catch (const json::type_error& e) {
      log_error(std::string("bad_fields detail=\"") + e.what() + "\"");
      return 2;
    }
    if (rc != ErrorCode::Ok) return fail(rc, to_string(*kind));

    const std::string id = enc_id.empty() ? generate_packet_id() : enc_id;
    std::string line;
    rc = make_clear_packet(payload, id, line);
    if (rc != ErrorCode::Ok) return fail(rc, "encode");

    const auto budget = budget_for(enc_profile, enc_max_chars);
    if (!budget) return fail(ErrorCode::FieldOutOfRange, "unknown profile " + enc_profile);

    print_lines(chunk_line(line, *budget), format, ansi);
    return 0;
  }

  // ---- chunk ----
  if (*cmd_chunk) {
    const auto budget = budget_for(chk_profile, chk_max_chars);
    if (!budget) return fail(ErrorCode::FieldOutOfRange, "unknown profile " + chk_profile);

    FramedPacket pkt;
    const ErrorCode rc = parse_packet_status(chk_line, pkt);
    if (rc != ErrorCode::Ok) return fail(rc, chk_line);

    print_lines(chunk_packet(pkt, *budget), format, ansi);
    return 0;
  }

  // ---- reassemble / decode ----
  if (*cmd_reassemble || *cmd_decode) {
    const std::string text = (*cmd_decode && !dec_line.empty()) ? dec_line : read_all_stdin();
    const ReassemblyResult res = reassemble_text(text);
    if (!res.ok()) return fail(res.code, res.reason);

    const FramedPacket& pkt = *res.parsed;

    if (*cmd_reassemble) {
      if (format == "json") std::cout << packet_to_json(pkt).dump(2) << "\n";
      else if (format == "raw") std::cout << res.packet << "\n";
      else std::cout << ansi.bold(describe(pkt)) << "\n  " << res.packet << "\n";
      return 0;
    }

    if (pkt.is_secure()) {
      // ciphertext only: report the envelope, the key store decrypts elsewhere
      SecureEnvelope env;
      const ErrorCode rc = split_secure_payload(pkt.payload, env);
      if (rc != ErrorCode::Ok) return fail(rc, "secure envelope");
      const std::string aad = make_secure_aad(pkt.template_id, pkt.id, pkt.part, pkt.total, pkt.kid());
      if (format == "json") {
        json j = packet_to_json(pkt);
        j["envelope"] = {{"version", env.version}, {"nonceLen", env.nonce.size()},
                         {"ciphertextLen", env.ciphertext.size()}, {"aad", aad}};
        std::cout << j.dump(2) << "\n";
      } else if (format == "raw") {
        std::cout << res.packet << "\n";
      } else {
        std::cout << ansi.bold(describe(pkt)) << "\n"
                  << "  envelope v" << int(env.version) << " nonce=" << env.nonce.size()
                  << " ciphertext=" << env.ciphertext.size() << "\n"
                  << "  aad " << aad << "\n";
      }
      return 0;
    }

    PacketPayload payload;
    const ErrorCode rc = decode_payload_b64(pkt.template_id, pkt.payload, payload);
    if (rc != ErrorCode::Ok) return fail(rc, describe(pkt));

    if (format == "json") {
      json j = packet_to_json(pkt);
      j["decoded"] = payload_to_json(payload);
      std::cout << j.dump(2) << "\n";
    } else if (format == "raw") {
      std::cout << describe(payload) << "\n";
    } else {
      std::cout << ansi.bold(describe(pkt)) << "\n  " << describe(payload) << "\n";
    }
    return 0;
  }

  // ---- profiles ----
  if (*cmd_profiles) {
    if (format == "json") {
      json arr = json::array();
      for (size_t i = 0; i < PROFILE_COUNT; ++i) {
        const ProfileInfo& p = profile_at(i);
        arr.push_back({{"name", p.name}, {"maxChars", p.max_chars},
                       {"default", p.profile == DEFAULT_PROFILE}});
      }
      std::cout << arr.dump(2) << "\n";
    } else {
      for (size_t i = 0; i < PROFILE_COUNT; ++i) {
        const ProfileInfo& p = profile_at(i);
        std::cout << std::left << std::setw(12) << p.name << " " << p.max_chars
                  << (cfg.profile == p.name ? ansi.dim("  (configured)") : std::string()) << "\n";
      }
    }
    return 0;
  }

  // ---- id ----
  if (*cmd_id) {
    std::cout << generate_packet_id(id_len) << "\n";
    return 0;
  }

  return 0;
}
