#include "contact_service.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/core/entity_store.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "observe.hpp"

namespace gigbook::service {

using core::collections::kContacts;

namespace {

util::Outcome<v1::Contact> ContactNotFound() {
  return util::Outcome<v1::Contact>::Err(db::ErrorCode::NotFound, "contact not found");
}

google::protobuf::FieldMask MaskOf(const char* path) {
  google::protobuf::FieldMask mask;
  mask.add_paths(path);
  return mask;
}

} // namespace

ContactService::ContactService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store) throw std::invalid_argument("ContactService requires an entity store");
}

core::ListOptions ContactService::DefaultListOptions() {
  core::ListOptions options;
  options.sort_by = "name";
  options.sort_order = core::SortOrder::kAscending;
  return options;
}

util::Outcome<v1::Contact> ContactService::CreateContact(v1::Contact contact) {
  return Observe("ContactService.CreateContact", [&] { return ctx_.store->Create(kContacts, std::move(contact)); });
}

std::optional<v1::Contact> ContactService::GetContact(const std::string& id) {
  return ctx_.store->Read(kContacts, id);
}

util::Outcome<v1::Contact> ContactService::UpdateContact(const std::string& id, const v1::Contact& patch, const google::protobuf::FieldMask& mask) {
  return Observe("ContactService.UpdateContact", [&] { return ctx_.store->Update(kContacts, id, patch, mask); });
}

void ContactService::DeleteContact(const std::string& id) {
  ctx_.store->Delete(kContacts, id);
}

std::vector<v1::Contact> ContactService::ListContacts(const core::ListOptions& options) {
  return ctx_.store->List(kContacts, options);
}

util::Outcome<v1::Contact> ContactService::AddInteraction(const std::string& contact_id, v1::Interaction interaction) {
  return Observe("ContactService.AddInteraction", [&] {
    auto contact = ctx_.store->Read(kContacts, contact_id);
    if (!contact) return ContactNotFound();

    interaction.set_id(util::NewId());
    *interaction.mutable_created_at() = util::NowProto();
    *contact->add_interactions() = std::move(interaction);

    auto updated = ctx_.store->Update(kContacts, contact_id, *contact, MaskOf("interactions"));
    // deleted between the read and the write
    if (!updated && updated.code() == db::ErrorCode::NotFound) return ContactNotFound();
    return updated;
  });
}

util::Outcome<v1::Contact> ContactService::AddReminder(const std::string& contact_id, v1::Reminder reminder) {
  return Observe("ContactService.AddReminder", [&] {
    auto contact = ctx_.store->Read(kContacts, contact_id);
    if (!contact) return ContactNotFound();

    reminder.set_id(util::NewId());
    *reminder.mutable_created_at() = util::NowProto();
    *contact->add_reminders() = std::move(reminder);

    auto updated = ctx_.store->Update(kContacts, contact_id, *contact, MaskOf("reminders"));
    if (!updated && updated.code() == db::ErrorCode::NotFound) return ContactNotFound();
    return updated;
  });
}

util::Outcome<v1::Contact> ContactService::CompleteReminder(const std::string& contact_id, const std::string& reminder_id) {
  return Observe("ContactService.CompleteReminder", [&] {
    auto contact = ctx_.store->Read(kContacts, contact_id);
    if (!contact) return ContactNotFound();

    auto* reminders = contact->mutable_reminders();
    auto it = std::find_if(reminders->begin(), reminders->end(), [&](const v1::Reminder& r) { return r.id() == reminder_id; });
    if (it == reminders->end()) {
      return util::Outcome<v1::Contact>::Err(db::ErrorCode::NotFound, "reminder not found");
    }
    it->set_completed(true);
    *it->mutable_completed_at() = util::NowProto();

    auto updated = ctx_.store->Update(kContacts, contact_id, *contact, MaskOf("reminders"));
    if (!updated && updated.code() == db::ErrorCode::NotFound) return ContactNotFound();
    return updated;
  });
}

std::vector<PendingReminder> ContactService::PendingReminders(std::optional<google::protobuf::Timestamp> due_before) {
  std::vector<PendingReminder> pending;
  for (const auto& contact : ctx_.store->List(kContacts, DefaultListOptions())) {
    for (const auto& reminder : contact.reminders()) {
      if (reminder.completed()) continue;
      if (due_before && util::ToUnixMillis(reminder.due_date()) > util::ToUnixMillis(*due_before)) continue;
      pending.push_back(PendingReminder{contact.id(), contact.name(), reminder});
    }
  }
  std::stable_sort(pending.begin(), pending.end(), [](const PendingReminder& a, const PendingReminder& b) {
    return util::ToUnixMillis(a.reminder.due_date()) < util::ToUnixMillis(b.reminder.due_date());
  });
  return pending;
}

} // namespace gigbook::service
