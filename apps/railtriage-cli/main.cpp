/**
 * railtriage-cli: triage one complaint (or a chat message) and print the decision.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/railtriage_cli --text "Seat broken, smells bad" --location "Coach-B12" [--repeat 2]
 */

#include <railtriage/analytics/decision_log.hpp>
#include <railtriage/analytics/trend_report.hpp>
#include <railtriage/app/config.hpp>
#include <railtriage/app/engine_builder.hpp>
#include <railtriage/core/category.hpp>
#include <railtriage/core/complaint.hpp>
#include <railtriage/nlp/chat_intake.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::optional<std::vector<std::byte>> read_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return std::nullopt;
  std::vector<char> raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  std::vector<std::byte> bytes(raw.size());
  if (!raw.empty()) std::memcpy(bytes.data(), raw.data(), raw.size());
  return bytes;
}

std::string format_time(railtriage::core::Timestamp t) {
  const std::time_t tt = railtriage::core::SystemClock::to_time_t(t);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return os.str();
}

std::string describe(const railtriage::core::ComplaintDecision& d) {
  using railtriage::core::to_string;
  std::ostringstream out;
  out << "complaint_id=" << d.complaint_id << " category=" << to_string(d.category)
      << " department=" << to_string(d.department) << " urgency=" << std::fixed
      << std::setprecision(2) << d.urgency << " sla_deadline=" << format_time(d.sla_deadline);
  if (d.duplicate_of) out << " duplicate_of=" << *d.duplicate_of;
  out << " new_cluster=" << (d.is_new_cluster ? "yes" : "no") << "\n";
  out << "  confidence=" << d.confidence << " model=" << d.model_name
      << " model_category=" << to_string(d.model_category)
      << " location=" << d.location_token << " sentiment=" << to_string(d.sentiment);
  if (d.cluster_id) out << " cluster=" << *d.cluster_id << " members=" << d.cluster_member_count;
  if (d.urgency_escalated) out << " escalated";
  out << " processing_ms=" << d.processing_ms << "\n";
  if (d.quality.degraded()) {
    out << "  degraded:";
    if (d.quality.ocr_degraded) out << " ocr";
    if (d.quality.media_degraded) out << " media";
    if (d.quality.classifier_fallback) out << " classifier_fallback";
    if (d.quality.dedup_degraded) out << " dedup";
    out << "\n";
  }
  for (const auto& note : d.quality.notes) out << "  note: " << note << "\n";
  return out.str();
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string text;
  std::optional<std::string> location;
  std::string image_path;
  std::string video_ref;
  std::string chat;
  std::string backend_override;  // "keyword" or "onnx"
  std::string model_override;
  std::string log_level = "info";
  long budget_ms = 0;
  int repeat = 1;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--text" && i + 1 < argc) {
      text = argv[++i];
    } else if (arg == "--location" && i + 1 < argc) {
      location = argv[++i];
    } else if (arg == "--image" && i + 1 < argc) {
      image_path = argv[++i];
    } else if (arg == "--video" && i + 1 < argc) {
      video_ref = argv[++i];
    } else if (arg == "--chat" && i + 1 < argc) {
      chat = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--budget-ms" && i + 1 < argc) {
      budget_ms = std::strtol(argv[++i], nullptr, 10);
    } else if (arg == "--repeat" && i + 1 < argc) {
      repeat = std::max(1, static_cast<int>(std::strtol(argv[++i], nullptr, 10)));
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: railtriage_cli [options]\n"
                << "  --config <path>     Engine config (key=value file); default: built-in\n"
                << "  --text <text>       Complaint text\n"
                << "  --location <loc>    Reporter location (e.g. \"Coach-B12\")\n"
                << "  --image <path>      Attached image\n"
                << "  --video <ref>       Attached video (path/URI)\n"
                << "  --chat <message>    Chat message; triaged only if it reads as a complaint\n"
                << "  --backend <type>    Override model backend: keyword | onnx\n"
                << "  --model <path>      Override model path (required for --backend onnx)\n"
                << "  --budget-ms <n>     Latency budget for this run\n"
                << "  --repeat <n>        Submit the complaint n times (shows deduplication)\n"
                << "  --log-level <lvl>   trace | debug | info | warn | error | off\n";
      return 0;
    }
  }

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  railtriage::app::TriageConfig cfg;
  try {
    cfg = config_path.empty() ? railtriage::app::default_config()
                              : railtriage::app::load_config(config_path);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  if (!backend_override.empty()) {
    if (backend_override == "keyword") {
      cfg.model_backend = railtriage::app::ModelBackendType::Keyword;
    } else if (backend_override == "onnx") {
      cfg.model_backend = railtriage::app::ModelBackendType::Onnx;
    } else {
      std::cerr << "Unknown --backend " << backend_override << " (use keyword or onnx)\n";
      return 1;
    }
  }
  if (!model_override.empty()) {
    cfg.model_path = model_override;
  }

  const auto now = railtriage::core::SystemClock::now();
  railtriage::core::ComplaintInput input;
  if (!chat.empty()) {
    railtriage::nlp::ChatIntake intake;
    const auto analysis = intake.analyze(chat);
    std::cout << "chat intent=" << railtriage::nlp::to_string(analysis.intent) << "\n";
    auto candidate = intake.to_complaint(chat, now);
    if (!candidate) {
      std::cout << "not a complaint; nothing to triage\n";
      return 0;
    }
    input = std::move(*candidate);
  } else {
    input.text = text;
    input.reporter_location = location;
    input.submitted_at = now;
  }
  if (!image_path.empty()) {
    auto bytes = read_file(image_path);
    if (!bytes) {
      std::cerr << "Failed to read image: " << image_path << "\n";
      return 1;
    }
    input.image_bytes = std::move(*bytes);
  }
  if (!video_ref.empty()) input.video_ref = video_ref;

  auto log = std::make_shared<railtriage::analytics::DecisionLog>();
  railtriage::app::TriageEngine engine;
  try {
    engine = railtriage::app::build_engine(cfg, log);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  std::optional<std::chrono::milliseconds> budget;
  if (budget_ms > 0) budget = std::chrono::milliseconds(budget_ms);

  for (int i = 0; i < repeat; ++i) {
    auto decision = engine.orchestrator->triage(input, budget);
    if (!decision) {
      std::cerr << "Triage error: " << railtriage::core::to_string(decision.error())
                << " (please retry)\n";
      return 1;
    }
    std::cout << describe(*decision);
  }

  if (repeat > 1) {
    const auto decisions = log->snapshot();
    const auto perf = railtriage::analytics::performance_summary(decisions);
    std::cout << "summary: total=" << perf.total << " duplicates=" << perf.duplicates
              << " degraded=" << perf.degraded << " avg_ms=" << perf.average_processing_ms
              << "\n";
  }
  return 0;
}
