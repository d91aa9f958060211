#include "validators.hpp"

#include <google/protobuf/util/time_util.h>

#include <algorithm>
#include <cctype>
#include <vector>
#include <regex>

#include "internal/util/uuid.hpp"

namespace gigbook::validation {

namespace {

using google::protobuf::Timestamp;
using google::protobuf::util::TimeUtil;

const std::vector<std::string_view> kCaptureMethods   = {"text", "voice", "image", "mixed"};
const std::vector<std::string_view> kAttachmentTypes  = {"audio", "image", "video", "file"};
const std::vector<std::string_view> kSetListResponses = {"excellent", "good", "mixed", "poor"};
const std::vector<std::string_view> kAcoustics        = {"excellent", "good", "poor"};
const std::vector<std::string_view> kLighting         = {"professional", "basic", "minimal"};
const std::vector<std::string_view> kStageSizes       = {"small", "medium", "large"};
const std::vector<std::string_view> kInteractionTypes = {"email", "phone", "meeting", "performance", "social"};
const std::vector<std::string_view> kPerformanceState = {"scheduled", "in-progress", "completed", "cancelled"};
const std::vector<std::string_view> kAudienceResponse = {"poor", "fair", "good", "great", "excellent"};

std::string Join(const std::vector<std::string_view>& values) {
  std::string out;
  for (auto v : values) {
    if (!out.empty()) out += ", ";
    out += v;
  }
  return out;
}

class Checker {
 public:
  explicit Checker(ValidationErrors& errors, std::string prefix = {}) : errors_(errors), prefix_(std::move(prefix)) {
  }

  Checker Nested(const std::string& path) const {
    return Checker(errors_, prefix_ + path + ".");
  }

  void Fail(const std::string& path, std::string message) const {
    errors_.push_back({prefix_ + path, std::move(message)});
  }

  void Length(const std::string& path, const std::string& value, std::size_t min, std::size_t max) const {
    const auto length = CodePointLength(value);
    if (length < min) {
      Fail(path, min == 1 ? "is required" : "must be at least " + std::to_string(min) + " characters");
    } else if (length > max) {
      Fail(path, "must be at most " + std::to_string(max) + " characters");
    }
  }

  void Range(const std::string& path, double value, double min, double max) const {
    if (value < min || value > max) {
      Fail(path, "must be between " + Format(min) + " and " + Format(max));
    }
  }

  void Min(const std::string& path, double value, double min) const {
    if (value < min) Fail(path, "must be at least " + Format(min));
  }

  void OneOf(const std::string& path, const std::string& value, const std::vector<std::string_view>& allowed) const {
    if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
      Fail(path, "must be one of: " + Join(allowed));
    }
  }

  void Uuid(const std::string& path, const std::string& value) const {
    if (!util::IsUuidString(value)) Fail(path, "must be a UUID");
  }

  void Present(const std::string& path, bool has) const {
    if (!has) Fail(path, "is required");
  }

  void ValidTimestamp(const std::string& path, const Timestamp& ts) const {
    if (ts.seconds() < TimeUtil::kTimestampMinSeconds || ts.seconds() > TimeUtil::kTimestampMaxSeconds || ts.nanos() < 0 ||
        ts.nanos() > 999999999) {
      Fail(path, "must be a valid date-time");
    }
  }

 private:
  static std::string Format(double v) {
    std::string s = std::to_string(v);
    s.erase(s.find_last_not_of('0') + 1);
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
  }

  ValidationErrors& errors_;
  std::string       prefix_;
};

template <typename T>
void CheckEntityEnvelope(const Checker& c, const T& entity) {
  c.Uuid("id", entity.id());
  c.Present("createdAt", entity.has_created_at());
  c.Present("updatedAt", entity.has_updated_at());
  if (entity.has_created_at()) c.ValidTimestamp("createdAt", entity.created_at());
  if (entity.has_updated_at()) c.ValidTimestamp("updatedAt", entity.updated_at());
  if (entity.has_created_at() && entity.has_updated_at() && entity.updated_at() < entity.created_at()) {
    c.Fail("updatedAt", "must not precede createdAt");
  }
  if (entity.has_version()) c.Min("version", entity.version(), 1);
}

std::string Index(const std::string& field, int i) {
  return field + "[" + std::to_string(i) + "]";
}

void CheckNote(const Checker& c, const v1::Note& note) {
  CheckEntityEnvelope(c, note);

  c.Length("content", note.content(), 1, 10000);
  c.OneOf("captureMethod", note.capture_method(), kCaptureMethods);

  if (note.tags_size() > 20) c.Fail("tags", "must have at most 20 items");
  for (int i = 0; i < note.tags_size(); ++i) {
    c.Length(Index("tags", i), note.tags(i), 1, 50);
  }

  if (note.has_venue()) c.Length("venue", note.venue(), 0, 200);
  if (note.has_audience()) c.Length("audience", note.audience(), 0, 100);
  if (note.has_estimated_duration()) c.Range("estimatedDuration", note.estimated_duration(), 0, 7200);

  if (note.has_metadata()) {
    const auto  m  = c.Nested("metadata");
    const auto& md = note.metadata();
    if (md.has_duration()) m.Min("duration", md.duration(), 0);
    if (md.has_confidence()) m.Range("confidence", md.confidence(), 0, 1);
    if (md.has_location()) {
      const auto l = m.Nested("location");
      l.Range("latitude", md.location().latitude(), -90, 90);
      l.Range("longitude", md.location().longitude(), -180, 180);
      if (md.location().has_accuracy()) l.Min("accuracy", md.location().accuracy(), 0);
    }
  }

  if (note.attachments_size() > 10) c.Fail("attachments", "must have at most 10 items");
  for (int i = 0; i < note.attachments_size(); ++i) {
    const auto  a          = c.Nested(Index("attachments", i));
    const auto& attachment = note.attachments(i);
    a.Length("id", attachment.id(), 1, 200);
    a.OneOf("type", attachment.type(), kAttachmentTypes);
    a.Length("filename", attachment.filename(), 1, 255);
    a.Min("size", attachment.size(), 0);
    if (attachment.has_duration()) a.Min("duration", attachment.duration(), 0);
  }
}

} // namespace

std::size_t CodePointLength(std::string_view value) {
  return static_cast<std::size_t>(std::count_if(value.begin(), value.end(), [](char ch) { return (static_cast<unsigned char>(ch) & 0xC0) != 0x80; }));
}

bool IsEmail(std::string_view value) {
  if (value.empty() || value.size() > 320) return false;
  if (std::any_of(value.begin(), value.end(), [](char ch) { return std::isspace(static_cast<unsigned char>(ch)); })) return false;

  const auto at = value.find('@');
  if (at == std::string_view::npos || at == 0 || value.find('@', at + 1) != std::string_view::npos) return false;

  const auto domain = value.substr(at + 1);
  const auto dot    = domain.rfind('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 >= domain.size()) return false;
  return domain.find("..") == std::string_view::npos && domain.front() != '.';
}

bool IsPhone(std::string_view value) {
  static const std::regex kPhone(R"(^[+]?[0-9\s\-\(\)]{7,20}$)");
  return std::regex_match(value.begin(), value.end(), kPhone);
}

ValidationErrors Validate(const v1::Note& note) {
  ValidationErrors errors;
  CheckNote(Checker(errors), note);
  return errors;
}

ValidationErrors Validate(const v1::SetList& set_list) {
  ValidationErrors errors;
  Checker          c(errors);
  CheckEntityEnvelope(c, set_list);

  c.Length("name", set_list.name(), 1, 200);
  if (set_list.notes_size() > 100) c.Fail("notes", "must have at most 100 items");
  for (int i = 0; i < set_list.notes_size(); ++i) {
    CheckNote(c.Nested(Index("notes", i)), set_list.notes(i));
  }
  c.Min("totalDuration", set_list.total_duration(), 0);
  if (set_list.has_venue()) c.Length("venue", set_list.venue(), 0, 200);
  if (set_list.has_description()) c.Length("description", set_list.description(), 0, 1000);
  if (set_list.has_performance_date()) c.ValidTimestamp("performanceDate", set_list.performance_date());

  for (int i = 0; i < set_list.feedback_size(); ++i) {
    const auto  f        = c.Nested(Index("feedback", i));
    const auto& feedback = set_list.feedback(i);
    f.Length("id", feedback.id(), 1, 200);
    f.Range("rating", feedback.rating(), 1, 5);
    f.OneOf("audienceResponse", feedback.audience_response(), kSetListResponses);
    if (feedback.has_notes()) f.Length("notes", feedback.notes(), 0, 1000);
  }
  return errors;
}

ValidationErrors Validate(const v1::Venue& venue) {
  ValidationErrors errors;
  Checker          c(errors);
  CheckEntityEnvelope(c, venue);

  c.Length("name", venue.name(), 1, 200);
  c.Length("location", venue.location(), 1, 500);

  const auto  ch              = c.Nested("characteristics");
  const auto& characteristics = venue.characteristics();
  ch.Range("audienceSize", characteristics.audience_size(), 0, 100000);
  ch.Length("audienceType", characteristics.audience_type(), 0, 100);
  ch.OneOf("acoustics", characteristics.acoustics(), kAcoustics);
  ch.OneOf("lighting", characteristics.lighting(), kLighting);
  if (characteristics.has_stage_size()) ch.OneOf("stageSize", characteristics.stage_size(), kStageSizes);
  if (characteristics.has_microphone_type()) ch.Length("microphoneType", characteristics.microphone_type(), 0, 100);

  if (venue.has_description()) c.Length("description", venue.description(), 0, 1000);
  for (int i = 0; i < venue.contacts_size(); ++i) {
    c.Uuid(Index("contacts", i), venue.contacts(i));
  }

  for (int i = 0; i < venue.performance_history_size(); ++i) {
    const auto  p     = c.Nested(Index("performanceHistory", i));
    const auto& entry = venue.performance_history(i);
    p.Length("id", entry.id(), 1, 200);
    p.Present("date", entry.has_date());
    p.Min("duration", entry.duration(), 0);
    if (entry.has_audience_size()) p.Min("audienceSize", entry.audience_size(), 0);
    if (entry.has_rating()) p.Range("rating", entry.rating(), 1, 5);
    if (entry.has_notes()) p.Length("notes", entry.notes(), 0, 1000);
  }
  return errors;
}

ValidationErrors Validate(const v1::Contact& contact) {
  ValidationErrors errors;
  Checker          c(errors);
  CheckEntityEnvelope(c, contact);

  c.Length("name", contact.name(), 1, 200);
  c.Length("role", contact.role(), 1, 100);
  if (contact.has_venue()) c.Uuid("venue", contact.venue());

  const auto  info    = c.Nested("contactInfo");
  const auto& details = contact.contact_info();
  if (details.has_email() && !IsEmail(details.email())) info.Fail("email", "must be a valid email address");
  if (details.has_phone() && !IsPhone(details.phone())) info.Fail("phone", "must be a valid phone number");
  for (const auto& [network, handle] : details.social()) {
    const bool key_ok = !network.empty() && std::all_of(network.begin(), network.end(), [](char ch) {
      return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
    });
    if (!key_ok) info.Fail("social." + network, "key must contain only letters, digits and underscores");
    info.Length("social." + network, handle, 0, 100);
  }
  if (details.has_address()) info.Length("address", details.address(), 0, 500);

  if (contact.has_notes()) c.Length("notes", contact.notes(), 0, 2000);

  for (int i = 0; i < contact.interactions_size(); ++i) {
    const auto  in          = c.Nested(Index("interactions", i));
    const auto& interaction = contact.interactions(i);
    in.Length("id", interaction.id(), 1, 200);
    in.OneOf("type", interaction.type(), kInteractionTypes);
    in.Length("subject", interaction.subject(), 1, 1000);
    in.Present("date", interaction.has_date());
    if (interaction.has_notes()) in.Length("notes", interaction.notes(), 0, 2000);
  }

  for (int i = 0; i < contact.reminders_size(); ++i) {
    const auto  r        = c.Nested(Index("reminders", i));
    const auto& reminder = contact.reminders(i);
    r.Length("id", reminder.id(), 1, 200);
    r.Length("title", reminder.title(), 1, 200);
    if (reminder.has_description()) r.Length("description", reminder.description(), 0, 1000);
    r.Present("dueDate", reminder.has_due_date());
  }
  return errors;
}

ValidationErrors Validate(const v1::RehearsalSession& session) {
  ValidationErrors errors;
  Checker          c(errors);
  CheckEntityEnvelope(c, session);

  c.Uuid("setListId", session.set_list_id());
  c.Present("startTime", session.has_start_time());
  if (session.has_start_time() && session.has_end_time() && session.end_time() < session.start_time()) {
    c.Fail("endTime", "must not precede startTime");
  }
  c.Min("totalDuration", session.total_duration(), 0);
  c.Min("currentNoteIndex", session.current_note_index(), 0);

  for (int i = 0; i < session.note_timings_size(); ++i) {
    const auto  t      = c.Nested(Index("noteTimings", i));
    const auto& timing = session.note_timings(i);
    t.Length("noteId", timing.note_id(), 1, 200);
    t.Min("startTime", timing.start_time(), 0);
    if (timing.has_end_time()) t.Min("endTime", timing.end_time(), timing.start_time());
    if (timing.has_duration()) t.Min("duration", timing.duration(), 0);
  }
  return errors;
}

ValidationErrors Validate(const v1::Performance& performance) {
  ValidationErrors errors;
  Checker          c(errors);
  CheckEntityEnvelope(c, performance);

  c.Uuid("setListId", performance.set_list_id());
  c.Uuid("venueId", performance.venue_id());
  c.Present("date", performance.has_date());
  c.OneOf("status", performance.status(), kPerformanceState);
  if (performance.has_actual_duration()) c.Min("actualDuration", performance.actual_duration(), 0);
  if (performance.has_notes()) c.Length("notes", performance.notes(), 0, 2000);

  if (performance.has_feedback()) {
    const auto  f        = c.Nested("feedback");
    const auto& feedback = performance.feedback();
    f.Range("rating", feedback.rating(), 1, 5);
    if (feedback.has_audience_size()) f.Min("audienceSize", feedback.audience_size(), 0);
    if (feedback.has_audience_response()) f.OneOf("audienceResponse", feedback.audience_response(), kAudienceResponse);
    if (feedback.has_notes()) f.Length("notes", feedback.notes(), 0, 2000);
    for (int i = 0; i < feedback.material_feedback_size(); ++i) {
      const auto m = f.Nested(Index("materialFeedback", i));
      m.Length("noteId", feedback.material_feedback(i).note_id(), 1, 200);
      m.Range("rating", feedback.material_feedback(i).rating(), 1, 5);
    }
  }
  return errors;
}

std::string Describe(const ValidationErrors& errors) {
  std::string out;
  for (const auto& error : errors) {
    if (!out.empty()) out += "; ";
    out += error.path + ": " + error.message;
  }
  return out;
}

} // namespace gigbook::validation
