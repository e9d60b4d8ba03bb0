#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include <cstddef>
#include <string>
#include <vector>

#include <json/json.h>

// Server -> client: one single-key JSON object per line.
// Client -> server: raw text, one chunk per read, never JSON.
class Protocol {
public:
    enum MessageKind {
        MESSAGE,
        INPUT,
        ERROR
    };

    // Upper bound of a single read from a client
    static constexpr std::size_t max_chunk = 1024;

    static const char* key(MessageKind kind) {
        switch (kind) {
        case MESSAGE: return "message";
        case INPUT:   return "input";
        case ERROR:   return "error";
        }
        return "message";
    }

    // FastWriter already terminates the document with '\n'
    static std::string encode(MessageKind kind, const std::string& text) {
        Json::Value res;
        res[key(kind)] = text;
        return Json::FastWriter().write(res);
    }

    // Client text is kept verbatim apart from its line terminator
    static std::string decode(const char* data, std::size_t size) {
        std::string text(data, size);
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
            text.pop_back();
        return text;
    }

    static bool parse(const std::string& line, MessageKind& kind, std::string& text) {
        Json::Reader reader;
        Json::Value msg;
        if (!reader.parse(line, msg) || !msg.isObject() || msg.size() != 1)
            return false;

        const std::string name = msg.getMemberNames().front();
        if (name == "message")
            kind = MESSAGE;
        else if (name == "input")
            kind = INPUT;
        else if (name == "error")
            kind = ERROR;
        else
            return false;

        if (!msg[name].isString())
            return false;
        text = msg[name].asString();
        return true;
    }
};

// Splits a byte stream into lines, holding back an unterminated tail
// until the rest of it arrives
class LineBuffer {
    std::string pending;

public:
    std::vector<std::string> feed(const char* data, std::size_t size) {
        pending.append(data, size);
        std::vector<std::string> lines;
        std::size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (!line.empty())
                lines.push_back(line);
        }
        return lines;
    }

    bool empty() const {
        return pending.empty();
    }
};

#endif
