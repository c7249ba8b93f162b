#include <railtriage/nlp/chat_intake.hpp>
#include <algorithm>
#include <cctype>
#include <regex>
#include <string>

namespace railtriage::nlp {

namespace {

const std::regex& emergency_re() {
  static const std::regex re(
      R"(\b(emergency|urgent|theft|stolen|harassment|accident|medical|fire|smoke|danger)\b)");
  return re;
}
const std::regex& complaint_re() {
  static const std::regex re(
      R"(\b(complaint|problem|issue|broken|dirty|not working|help with|leaking|smell|smells|rude)\b)");
  return re;
}
const std::regex& status_re() {
  static const std::regex re(R"(\b(status|update|progress|complaint id|track|check)\b)");
  return re;
}
const std::regex& greeting_re() {
  static const std::regex re(
      R"(\b(hello|hi|hey|namaste|good morning|good afternoon|good evening)\b)");
  return re;
}
const std::regex& thanks_re() {
  static const std::regex re(R"(\b(thanks|thank you|appreciate|grateful)\b)");
  return re;
}

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string to_upper(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

ChatEntities extract_entities(const std::string& message) {
  ChatEntities e;
  std::smatch m;

  static const std::regex train_re(R"(\b\d{5}\b)");
  if (std::regex_search(message, m, train_re)) e.train_number = m.str();

  static const std::regex pnr_re(R"(\b\d{10}\b)");
  if (std::regex_search(message, m, pnr_re)) e.pnr_number = m.str();

  const std::string lowered = to_lower(message);
  static const std::regex coach_word_re(R"(\bcoach\s*-?\s*([a-z]{1,2}\d{1,2})\b)");
  static const std::regex coach_code_re(R"(\b[ABCDES][1-9]\b)");
  if (std::regex_search(lowered, m, coach_word_re)) {
    e.coach_number = to_upper(m.str(1));
  } else {
    const std::string upper = to_upper(message);
    if (std::regex_search(upper, m, coach_code_re)) e.coach_number = m.str();
  }

  static const std::regex seat_re(R"(\b\d{1,3}\b)");
  for (auto it = std::sregex_iterator(message.begin(), message.end(), seat_re);
       it != std::sregex_iterator(); ++it) {
    const int seat = std::stoi(it->str());
    if (seat >= 1 && seat <= 100) {
      e.seat_number = it->str();
      break;
    }
  }
  return e;
}

}  // namespace

const char* to_string(ChatIntent intent) noexcept {
  switch (intent) {
    case ChatIntent::Emergency: return "emergency";
    case ChatIntent::Complaint: return "complaint";
    case ChatIntent::Status: return "status";
    case ChatIntent::Greeting: return "greeting";
    case ChatIntent::Thanks: return "thanks";
    case ChatIntent::General: return "general";
  }
  return "general";
}

ChatAnalysis ChatIntake::analyze(std::string_view message) const {
  ChatAnalysis out;
  const std::string raw(message);
  const std::string lowered = to_lower(message);

  if (std::regex_search(lowered, emergency_re())) out.intent = ChatIntent::Emergency;
  else if (std::regex_search(lowered, complaint_re())) out.intent = ChatIntent::Complaint;
  else if (std::regex_search(lowered, status_re())) out.intent = ChatIntent::Status;
  else if (std::regex_search(lowered, greeting_re())) out.intent = ChatIntent::Greeting;
  else if (std::regex_search(lowered, thanks_re())) out.intent = ChatIntent::Thanks;
  else out.intent = ChatIntent::General;

  out.entities = extract_entities(raw);
  return out;
}

std::optional<core::ComplaintInput> ChatIntake::to_complaint(
    std::string_view message,
    core::Timestamp submitted_at) const {
  const auto first = message.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return std::nullopt;

  const ChatAnalysis analysis = analyze(message);
  if (analysis.intent != ChatIntent::Emergency && analysis.intent != ChatIntent::Complaint) {
    return std::nullopt;
  }

  core::ComplaintInput input;
  input.text = std::string(message.substr(first));
  input.submitted_at = submitted_at;

  std::string location;
  if (analysis.entities.train_number) location = "train " + *analysis.entities.train_number;
  if (analysis.entities.coach_number) {
    if (!location.empty()) location += ' ';
    location += "coach " + *analysis.entities.coach_number;
  }
  if (!location.empty()) input.reporter_location = std::move(location);
  return input;
}

}  // namespace railtriage::nlp
