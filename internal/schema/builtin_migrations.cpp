#include "builtin_migrations.hpp"

namespace gigbook::schema {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

void EnsureList(Struct& row, const std::string& key) {
  auto& fields = *row.mutable_fields();
  auto  it     = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != Value::kListValue) {
    fields[key].mutable_list_value();
  }
}

void RenameNoteType(Struct& row) {
  auto& fields = *row.mutable_fields();

  auto type_it = fields.find("type");
  if (type_it != fields.end()) {
    const Value legacy = type_it->second;
    fields.erase("type");
    if (fields.find("captureMethod") == fields.end()) {
      fields["captureMethod"] = legacy;
    }
  }

  auto capture_it = fields.find("captureMethod");
  if (capture_it == fields.end() || capture_it->second.string_value().empty()) {
    fields["captureMethod"].set_string_value("text");
  }
}

void AddSetListFeedback(Struct& row) {
  EnsureList(row, "feedback");

  double total = 0;
  auto   notes = row.fields().find("notes");
  if (notes != row.fields().end() && notes->second.kind_case() == Value::kListValue) {
    for (const auto& note : notes->second.list_value().values()) {
      if (note.kind_case() != Value::kStructValue) continue;
      auto metadata = note.struct_value().fields().find("metadata");
      if (metadata == note.struct_value().fields().end() || metadata->second.kind_case() != Value::kStructValue) continue;
      auto duration = metadata->second.struct_value().fields().find("duration");
      if (duration != metadata->second.struct_value().fields().end() && duration->second.kind_case() == Value::kNumberValue) {
        total += duration->second.number_value();
      }
    }
  }
  (*row.mutable_fields())["totalDuration"].set_number_value(total);
}

void AddContactLists(Struct& row) {
  EnsureList(row, "interactions");
  EnsureList(row, "reminders");
}

} // namespace

SchemaMigrator DefaultMigrator() {
  SchemaMigrator migrator;
  migrator.Register({model::Collection::kNotes, 1, "rename type to captureMethod", RenameNoteType});
  migrator.Register({model::Collection::kSetLists, 1, "add feedback, recompute totalDuration", AddSetListFeedback});
  migrator.Register({model::Collection::kContacts, 1, "add interactions and reminders", AddContactLists});
  return migrator;
}

} // namespace gigbook::schema
