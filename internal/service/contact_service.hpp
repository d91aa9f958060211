#pragma once

#include <google/protobuf/field_mask.pb.h>
#include <google/protobuf/timestamp.pb.h>

#include <optional>
#include <string>
#include <vector>

#include "gigbook/v1.hpp"
#include "internal/core/query.hpp"
#include "internal/util/outcome.hpp"
#include "service_context.hpp"

namespace gigbook::service {

struct PendingReminder {
  std::string contact_id;
  std::string contact_name;
  v1::Reminder reminder;
};

/*
  Contacts and their nested interaction and reminder lists.

  AddInteraction, AddReminder and CompleteReminder read the whole
  contact, change the nested list and write the list back. There is no
  per-contact lock: two such calls racing on one contact can lose one of
  the changes.
*/
class ContactService {
public:
  explicit ContactService(ServiceContext ctx);

  util::Outcome<v1::Contact> CreateContact(v1::Contact contact);
  std::optional<v1::Contact> GetContact(const std::string& id);
  util::Outcome<v1::Contact> UpdateContact(const std::string& id, const v1::Contact& patch, const google::protobuf::FieldMask& mask);
  void DeleteContact(const std::string& id);

  // name ascending unless told otherwise
  std::vector<v1::Contact> ListContacts(const core::ListOptions& options = DefaultListOptions());
  static core::ListOptions DefaultListOptions();

  // id and createdAt are assigned here.
  util::Outcome<v1::Contact> AddInteraction(const std::string& contact_id, v1::Interaction interaction);
  util::Outcome<v1::Contact> AddReminder(const std::string& contact_id, v1::Reminder reminder);
  util::Outcome<v1::Contact> CompleteReminder(const std::string& contact_id, const std::string& reminder_id);

  // Open reminders due at or before `due_before` (all open reminders when unset), earliest first.
  std::vector<PendingReminder> PendingReminders(std::optional<google::protobuf::Timestamp> due_before = std::nullopt);

private:
  ServiceContext ctx_;
};

}
