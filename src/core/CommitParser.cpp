#include "core/CommitParser.hpp"

#include <charconv>
#include <optional>
#include <utility>
#include <vector>

#include "core/Constants.hpp"
#include "core/ObjectReader.hpp"
#include "util/Logger.hpp"
#include "util/ObjectId.hpp"

namespace fs = std::filesystem;

namespace gitcontext {

namespace {

bool allDigits(const std::string& text) {
    if (text.empty()) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

}

CommitParser::CommitParser(const IFileSystem& fileSystem, fs::path objectsDir)
    : fileSystem(fileSystem), objectsDir(std::move(objectsDir)) {}

Expected<Signature> CommitParser::parseSignature(const std::string& value) {
    // "Name <email> <seconds> <offset>", split from the right
    Error malformed{ErrorCode::MalformedObject, "Invalid author format: " + value};
    if (value.find_first_of("\r\n") != std::string::npos) {
        return malformed;
    }

    size_t offsetSpace = value.rfind(' ');
    if (offsetSpace == std::string::npos || offsetSpace == 0) {
        return malformed;
    }
    size_t secondsSpace = value.rfind(' ', offsetSpace - 1);
    if (secondsSpace == std::string::npos || secondsSpace == 0) {
        return malformed;
    }
    std::string seconds = value.substr(secondsSpace + 1, offsetSpace - secondsSpace - 1);
    std::string zone = value.substr(offsetSpace + 1);
    bool signedZone = !zone.empty() && (zone[0] == '+' || zone[0] == '-');
    if (!allDigits(seconds) || !allDigits(signedZone ? zone.substr(1) : zone)) {
        return malformed;
    }

    // Identity part must end with '>'; the name ends at the last " <" before it
    if (value[secondsSpace - 1] != '>') {
        return malformed;
    }
    size_t emailEnd = secondsSpace - 1;
    size_t nameEnd = value.rfind(" <", emailEnd);
    if (nameEnd == std::string::npos || nameEnd + 2 > emailEnd) {
        return malformed;
    }

    Signature sig;
    sig.name = value.substr(0, nameEnd);
    sig.email = value.substr(nameEnd + 2, emailEnd - nameEnd - 2);

    int64_t epoch = 0;
    auto [end, ec] = std::from_chars(seconds.data(), seconds.data() + seconds.size(), epoch);
    if (ec != std::errc() || end != seconds.data() + seconds.size()) {
        return Error{ErrorCode::MalformedObject, "Invalid author timestamp: " + seconds};
    }

    auto offset = Timestamp::parseOffset(zone);
    if (!offset) return offset.error();

    sig.when.epochSeconds = epoch;
    sig.when.offsetMinutes = offset.value();
    return sig;
}

Expected<CommitInfo> CommitParser::parse(const std::string& commitHash) const {
    auto readerRes = ObjectReader::open(fileSystem, objectsDir, commitHash);
    if (!readerRes) return readerRes.error();
    ObjectReader& reader = *readerRes.value();

    auto type = reader.readHeader();
    if (!type) return type.error();
    if (type.value() != Constants::TYPE_COMMIT) {
        return Error{ErrorCode::MalformedObject, "Invalid commit object type: " + type.value()};
    }

    std::optional<Signature> author;
    std::vector<std::string> parents;

    while (true) {
        auto field = reader.readField();
        if (!field) return field.error();
        if (!field.value()) break;

        const ObjectField& entry = *field.value();
        if (entry.key == Constants::KEY_AUTHOR) {
            auto sig = parseSignature(entry.value);
            if (!sig) return sig.error();
            author = sig.value();
        } else if (entry.key == Constants::KEY_PARENT) {
            if (!isValidHash(entry.value)) {
                return Error{ErrorCode::MalformedObject, "Invalid parent hash: " + entry.value};
            }
            parents.push_back(entry.value);
        }
    }

    auto message = reader.readBody();
    if (!message) return message.error();

    if (!author) {
        return Error{ErrorCode::MalformedObject, "Invalid commit format: missing author in " + commitHash};
    }

    Logger::instance().debug("Parsed commit " + shortHash(commitHash) + " with "
                             + std::to_string(parents.size()) + " parent(s)");

    CommitInfo info;
    info.hash = commitHash;
    info.author = author->display();
    info.date = author->when;
    info.message = std::move(message.value());
    info.parents = std::move(parents);
    return info;
}

}
