#include "report/reporter.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<message_type, const char *> message_type_string = boost::assign::map_list_of
    (message_type::CONSOLE, "console")
    (message_type::STDOUT, "stdout")
    (message_type::STDERR, "stderr")
    (message_type::LAB, "lab")
    (message_type::INTERNAL_ERROR, "internal_error");
// clang-format on

const char *get_message_type_name(message_type type) {
    return message_type_string.at(type);
}

channel::~channel() = default;

reporter::reporter(channel &chan, const string &task_id, const optional<string> &lab_ref)
    : chan(&chan), task(task_id), lab_ref_(lab_ref) {}

reporter reporter::with_lab_ref(const optional<string> &lab_ref) const {
    return reporter(*chan, task, lab_ref);
}

void reporter::console(const string &command) {
    send(message_type::CONSOLE, command);
}

void reporter::out(const string &line) {
    send(message_type::STDOUT, line);
}

void reporter::err(const string &line) {
    send(message_type::STDERR, line);
}

void reporter::lab(bool success, const json &cases) {
    send(message_type::LAB, {{"success", success}, {"cases", cases}});
}

void reporter::internal_error(const string &message) {
    send(message_type::INTERNAL_ERROR, message);
}

const string &reporter::task_id() const {
    return task;
}

const optional<string> &reporter::lab_ref() const {
    return lab_ref_;
}

void reporter::send(message_type type, const json &data) {
    json message = {{"task_id", task}, {"type", get_message_type_name(type)}, {"data", data}};
    if (lab_ref_) message["lab_ref"] = *lab_ref_;
    chan->publish(message);
}

}  // namespace grader
