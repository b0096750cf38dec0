#include "judge/registry.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;

live_entry::live_entry(const submission &submit, admission_kind kind, size_t total)
    : id(submit.id), submitter(submit.submitter), problem(submit.problem), kind(kind), total(total),
      state(submission_state::QUEUED), completed(0) {}

live_progress live_entry::snapshot() const {
    return {id, submitter, problem, kind, state.load(), completed.load(), total};
}

submission_registry::registration::registration()
    : registry(nullptr) {}

submission_registry::registration::registration(submission_registry *registry, shared_ptr<live_entry> entry)
    : registry(registry), item(move(entry)) {}

submission_registry::registration::registration(registration &&other) noexcept
    : registry(other.registry), item(move(other.item)) {
    other.registry = nullptr;
}

submission_registry::registration &submission_registry::registration::operator=(registration &&other) noexcept {
    if (this != &other) {
        release();
        registry = other.registry;
        item = move(other.item);
        other.registry = nullptr;
    }
    return *this;
}

submission_registry::registration::~registration() {
    release();
}

submission_registry::registration::operator bool() const {
    return item != nullptr;
}

live_entry &submission_registry::registration::entry() const {
    if (!item) throw internal_error("registration does not hold an entry");
    return *item;
}

void submission_registry::registration::release() {
    if (registry && item) registry->remove(*item);
    registry = nullptr;
    item.reset();
}

submission_registry::registration submission_registry::admit(const submission &submit, admission_kind kind, size_t total, rejection_reason &reason) {
    scoped_lock lock(mut);
    if (by_id.count(submit.id)) {
        reason = rejection_reason::DUPLICATE_ID;
        return registration();
    }
    admission_key key(submit.submitter, submit.problem, kind);
    if (by_key.count(key)) {
        reason = rejection_reason::ALREADY_IN_FLIGHT;
        return registration();
    }

    auto entry = make_shared<live_entry>(submit, kind, total);
    by_id.emplace(submit.id, entry);
    by_key.emplace(key, submit.id);
    reason = rejection_reason::NONE;
    return registration(this, entry);
}

void submission_registry::remove(const live_entry &entry) {
    scoped_lock lock(mut);
    auto it = by_id.find(entry.id);
    if (it == by_id.end() || it->second.get() != &entry) {
        LOG(ERROR) << "Registry entry " << entry.id << " has already been removed";
        return;
    }
    by_id.erase(it);
    by_key.erase(admission_key(entry.submitter, entry.problem, entry.kind));
}

optional<live_progress> submission_registry::lookup(const string &id) const {
    scoped_lock lock(mut);
    auto it = by_id.find(id);
    if (it == by_id.end()) return nullopt;
    return it->second->snapshot();
}

vector<live_progress> submission_registry::list() const {
    scoped_lock lock(mut);
    vector<live_progress> result;
    for (auto &[id, entry] : by_id) result.push_back(entry->snapshot());
    return result;
}

bool submission_registry::cancel(const string &id) {
    scoped_lock lock(mut);
    auto it = by_id.find(id);
    if (it == by_id.end()) return false;
    it->second->cancel.cancel();
    return true;
}

void submission_registry::cancel_all() {
    scoped_lock lock(mut);
    for (auto &[id, entry] : by_id) entry->cancel.cancel();
}

size_t submission_registry::size() const {
    scoped_lock lock(mut);
    return by_id.size();
}

}  // namespace arbiter
