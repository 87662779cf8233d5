// messenger.cpp

#include "messenger.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace {

// Single quotes for the shell; embedded quotes closed and reopened
std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

}  // namespace

std::string message_kind_name(MessageKind kind) {
    switch (kind) {
        case MessageKind::Text: return "text";
        case MessageKind::Photo: return "photo";
        case MessageKind::Video: return "video";
    }
    return "text";
}

CommandMessenger::CommandMessenger(const std::string& command_template)
    : command_template(command_template) {}

bool CommandMessenger::send(const OutgoingMessage& message) {
    std::vector<std::string> recipients;
    if (!message.recipient.empty()) {
        recipients.push_back(message.recipient);
    }
    recipients.insert(recipients.end(), message.extra_recipients.begin(), message.extra_recipients.end());

    std::string summary = "[" + message_kind_name(message.kind) + (message.silent ? ", silent" : "") + "] ";
    log_status("Message " + summary + message.text +
               (message.attachment_path.empty() ? "" : " (" + message.attachment_path + ")"));

    if (command_template.empty()) {
        return true;
    }

    bool ok = true;
    for (const auto& recipient : recipients) {
        std::string command = fill_template(command_template, {
            {"kind", message_kind_name(message.kind)},
            {"recipient", shell_quote(recipient)},
            {"silent", message.silent ? "1" : "0"},
            {"text", shell_quote(message.text)},
            {"file", shell_quote(message.attachment_path)}});
        if (!run_command(command)) {
            log_status("ERROR: Failed sending message to " + recipient);
            ok = false;
        }
    }
    return ok;
}
