#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "cryptography/payload_hasher.hpp"
#include "data/data.hpp"

using namespace nlohmann;
using namespace nip98::data;
using namespace std;

using nip98::cryptography::PayloadHasher;

string Event::serialize() const
{
    bool hasCreatedAt = this->createdAt > 0;
    if (!hasCreatedAt)
    {
        throw invalid_argument("Event::serialize: A creation timestamp is required.");
    }

    bool hasKind = this->kind >= 0 && this->kind <= 65535;
    if (!hasKind)
    {
        throw invalid_argument("Event::serialize: A valid event kind is required.");
    }

    ordered_json j = {
        { "kind", this->kind },
        { "created_at", this->createdAt },
        { "content", this->content },
        { "tags", this->tags },
        { "pubkey", this->pubkey },
        { "sig", this->sig }
    };

    if (!this->id.empty())
    {
        j["id"] = this->id;
    }

    return j.dump();
};

Event Event::fromString(const string& jstr)
{
    json j;
    try
    {
        j = json::parse(jstr);
    }
    catch (const json::parse_error& pe)
    {
        ostringstream oss;
        oss << "Event::fromString: The string is not valid JSON: " << pe.what();
        throw invalid_argument(oss.str());
    }

    return Event::fromJson(j);
};

Event Event::fromJson(const json& j)
{
    if (!j.is_object())
    {
        throw invalid_argument("Event::fromJson: The event must be a JSON object.");
    }

    Event event;

    // A missing key yields a null value, which fails every type check below.
    json kind = j.value("kind", json());
    if (!kind.is_number())
    {
        throw invalid_argument("Event::fromJson: The event kind must be a number.");
    }

    // A fractional or out-of-range kind can never equal a valid kind constant.
    double kindValue = kind.get<double>();
    bool isIntegral = std::floor(kindValue) == kindValue && kindValue >= 0 && kindValue <= 65535;
    event.kind = isIntegral ? static_cast<int>(kindValue) : -1;

    json createdAt = j.value("created_at", json());
    if (!createdAt.is_number())
    {
        throw invalid_argument("Event::fromJson: The event creation timestamp must be a number.");
    }
    event.createdAt = Event::_readTimestamp(createdAt);

    json content = j.value("content", json());
    if (!content.is_string())
    {
        throw invalid_argument("Event::fromJson: The event content must be a string.");
    }
    event.content = content.get<string>();

    json tags = j.value("tags", json());
    if (!tags.is_array())
    {
        throw invalid_argument("Event::fromJson: The event tags must be an array.");
    }
    for (const auto& tag : tags)
    {
        if (!tag.is_array())
        {
            throw invalid_argument("Event::fromJson: Each event tag must be an array.");
        }

        vector<string> entry;
        for (const auto& item : tag)
        {
            if (!item.is_string())
            {
                throw invalid_argument("Event::fromJson: Each tag element must be a string.");
            }
            entry.push_back(item.get<string>());
        }
        event.tags.push_back(entry);
    }

    for (auto field : { "pubkey", "sig", "id" })
    {
        if (j.contains(field) && !j.at(field).is_string())
        {
            ostringstream oss;
            oss << "Event::fromJson: The event field '" << field << "' must be a string.";
            throw invalid_argument(oss.str());
        }
    }
    event.pubkey = j.value("pubkey", "");
    event.sig = j.value("sig", "");
    event.id = j.value("id", "");

    return event;
};

time_t Event::_readTimestamp(const json& value)
{
    if (value.is_number_unsigned())
    {
        if (value.get<uint64_t>() > static_cast<uint64_t>(numeric_limits<time_t>::max()))
        {
            throw invalid_argument("Event::fromJson: The event creation timestamp is out of range.");
        }
        return static_cast<time_t>(value.get<uint64_t>());
    }

    if (value.is_number_integer())
    {
        return value.get<time_t>();
    }

    // Both bounds are powers of two, so they convert to double exactly.
    const double lowest = static_cast<double>(numeric_limits<time_t>::min());
    const double upper = static_cast<double>(numeric_limits<time_t>::max());

    double seconds = std::floor(value.get<double>());
    if (!std::isfinite(seconds) || seconds < lowest || seconds >= upper)
    {
        throw invalid_argument("Event::fromJson: The event creation timestamp is out of range.");
    }

    return static_cast<time_t>(seconds);
};

string Event::generateId() const
{
    // Create a JSON array of values used to generate the event ID.
    json arr = { 0, this->pubkey, this->createdAt, this->kind, this->tags, this->content };
    string serializedData = arr.dump();

    return PayloadHasher::hashBytes(serializedData);
};

optional<string> Event::tagValue(const string& key) const
{
    for (const auto& tag : this->tags)
    {
        if (tag.empty() || tag[0] != key)
        {
            continue;
        }

        // Only the first tag with a matching name is considered.
        if (tag.size() < 2)
        {
            return nullopt;
        }

        return tag[1];
    }

    return nullopt;
};
