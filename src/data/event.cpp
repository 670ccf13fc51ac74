#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "data/data.hpp"
#include "errors.hpp"

using namespace hydrator;
using namespace hydrator::data;
using namespace nlohmann;
using namespace std;

string Event::serialize()
{
    this->validate();

    // Generate the event ID from the serialized data.
    this->generateId();

    json j = *this;
    return j.dump();
};

Event Event::fromString(string jstr)
{
    json j;
    try
    {
        j = json::parse(jstr);
    }
    catch (const json::parse_error& pe)
    {
        throw InvalidEventError(string("Event::fromString: Malformed event JSON: ") + pe.what());
    }

    return Event::fromJson(j);
};

Event Event::fromJson(json j)
{
    if (!j.is_object())
    {
        throw InvalidEventError("Event::fromJson: An event must be a JSON object.");
    }

    try
    {
        return j.get<Event>();
    }
    catch (const json::exception& je)
    {
        throw InvalidEventError(string("Event::fromJson: ") + je.what());
    }
};

string Event::computeId(
    const string& pubkey,
    time_t createdAt,
    int kind,
    const vector<vector<string>>& tags,
    const string& content)
{
    // Create a JSON array of values used to generate the event ID.
    json arr = json::array({ 0, pubkey, createdAt, kind, tags, content });
    string serializedData = arr.dump();

    unsigned char hash[SHA256_DIGEST_LENGTH];
    EVP_Digest(serializedData.c_str(), serializedData.length(), hash, NULL, EVP_sha256(), NULL);

    stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
    {
        ss << hex << setw(2) << setfill('0') << (int)hash[i];
    }

    return ss.str();
};

string Event::computeId() const
{
    return Event::computeId(this->pubkey, this->createdAt, this->kind, this->tags, this->content);
};

void Event::validate()
{
    bool hasPubkey = this->pubkey.length() > 0;
    if (!hasPubkey)
    {
        throw InvalidEventError("Event::validate: The pubkey of the event author is required.");
    }

    bool hasCreatedAt = this->createdAt > 0;
    if (!hasCreatedAt)
    {
        this->createdAt = time(nullptr);
    }

    bool hasKind = this->kind >= 0 && this->kind <= 65535;
    if (!hasKind)
    {
        throw InvalidEventError("Event::validate: A valid event kind is required.");
    }

    for (const auto& tag : this->tags)
    {
        if (tag.empty())
        {
            throw InvalidEventError("Event::validate: Tags must not be empty.");
        }
    }
};

void Event::generateId()
{
    this->id = this->computeId();
};

bool Event::operator==(const Event& other) const
{
    if (this->id.empty())
    {
        throw invalid_argument("Event::operator==: Cannot check equality, the left-side argument is undefined.");
    }
    if (other.id.empty())
    {
        throw invalid_argument("Event::operator==: Cannot check equality, the right-side argument is undefined.");
    }

    return this->id == other.id;
};

void adl_serializer<Event>::to_json(json& j, const Event& event)
{
    j = {
        { "id", event.id },
        { "pubkey", event.pubkey },
        { "created_at", event.createdAt },
        { "kind", event.kind },
        { "tags", event.tags },
        { "content", event.content },
        { "sig", event.sig },
    };
}

void adl_serializer<Event>::from_json(const json& j, Event& event)
{
    // Every field is required; a missing or mistyped field surfaces as a json exception.
    event.id = j.at("id").get<string>();
    event.pubkey = j.at("pubkey").get<string>();
    event.createdAt = j.at("created_at").get<time_t>();
    event.kind = j.at("kind").get<int>();
    event.tags = j.at("tags").get<vector<vector<string>>>();
    event.content = j.at("content").get<string>();
    event.sig = j.at("sig").get<string>();
}
