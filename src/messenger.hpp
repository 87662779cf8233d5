#pragma once

#include <string>
#include <vector>

enum class MessageKind {
    Text,
    Photo,
    Video
};

std::string message_kind_name(MessageKind kind);

struct OutgoingMessage {
    MessageKind kind = MessageKind::Text;
    std::string recipient;
    std::string text;            // body, or caption for photo/video
    std::string attachment_path; // photo/video file
    bool silent = false;
    std::vector<std::string> extra_recipients;
};

// Gateway to the chat transport
class Messenger {
public:
    virtual ~Messenger() = default;

    virtual bool send(const OutgoingMessage& message) = 0;
};

// Logs every message and, when send_command is configured, runs it once per recipient
// with {kind} {recipient} {silent} {text} {file} substituted.
class CommandMessenger : public Messenger {
private:
    std::string command_template;

public:
    explicit CommandMessenger(const std::string& command_template);

    bool send(const OutgoingMessage& message) override;
};
