#include <random>
#include <stdexcept>

#include <uuid_v4.h>

#include "data/message.hpp"
#include "errors.hpp"

using namespace hydrator;
using namespace hydrator::data;
using namespace nlohmann;
using namespace std;

namespace
{
string requireString(const json& jMessage, size_t index)
{
    if (jMessage.size() <= index || !jMessage.at(index).is_string())
    {
        throw ProtocolError(
            "Frame::fromString: Expected a string at position " + to_string(index) + ".");
    }

    return jMessage.at(index).get<string>();
}

string optionalString(const json& jMessage, size_t index)
{
    if (jMessage.size() <= index || !jMessage.at(index).is_string())
    {
        return string();
    }

    return jMessage.at(index).get<string>();
}
} // namespace

Frame Frame::fromString(const string& payload)
{
    json jMessage = json::parse(payload, nullptr, false);
    if (jMessage.is_discarded())
    {
        throw ProtocolError("Frame::fromString: The payload is not valid JSON.");
    }
    if (!jMessage.is_array() || jMessage.empty())
    {
        throw ProtocolError("Frame::fromString: A relay message must be a non-empty JSON array.");
    }

    Frame frame;
    string messageType = requireString(jMessage, 0);

    if (messageType == "EVENT")
    {
        frame.type = FrameType::EVENT;
        frame.subscriptionId = requireString(jMessage, 1);
        if (jMessage.size() < 3)
        {
            throw ProtocolError("Frame::fromString: EVENT message has no event payload.");
        }

        try
        {
            frame.event = make_shared<Event>(Event::fromJson(jMessage.at(2)));
        }
        catch (const InvalidEventError& ie)
        {
            throw ProtocolError(string("Frame::fromString: Malformed event: ") + ie.what());
        }
    }
    else if (messageType == "EOSE")
    {
        frame.type = FrameType::EOSE;
        frame.subscriptionId = requireString(jMessage, 1);
    }
    else if (messageType == "NOTICE")
    {
        frame.type = FrameType::NOTICE;
        frame.message = optionalString(jMessage, 1);
    }
    else if (messageType == "OK")
    {
        frame.type = FrameType::OK;
        frame.eventId = requireString(jMessage, 1);
        if (jMessage.size() < 3 || !jMessage.at(2).is_boolean())
        {
            throw ProtocolError("Frame::fromString: OK message has no acceptance flag.");
        }
        frame.accepted = jMessage.at(2).get<bool>();
        frame.message = optionalString(jMessage, 3);
    }
    else if (messageType == "AUTH")
    {
        frame.type = FrameType::AUTH;
        frame.challenge = requireString(jMessage, 1);
    }
    else if (messageType == "CLOSED")
    {
        frame.type = FrameType::CLOSED;
        frame.subscriptionId = requireString(jMessage, 1);
        frame.message = optionalString(jMessage, 2);
    }
    else
    {
        throw ProtocolError("Frame::fromString: Unknown message type " + messageType + ".");
    }

    return frame;
};

string Frame::target() const
{
    switch (this->type)
    {
    case FrameType::EVENT:
    case FrameType::EOSE:
    case FrameType::CLOSED:
        return this->subscriptionId;
    case FrameType::OK:
        return this->eventId;
    case FrameType::NOTICE:
    case FrameType::AUTH:
        break;
    }

    return "";
};

string hydrator::data::toString(FrameType type)
{
    switch (type)
    {
    case FrameType::EVENT:
        return "EVENT";
    case FrameType::EOSE:
        return "EOSE";
    case FrameType::NOTICE:
        return "NOTICE";
    case FrameType::OK:
        return "OK";
    case FrameType::AUTH:
        return "AUTH";
    case FrameType::CLOSED:
        return "CLOSED";
    }

    return "UNKNOWN";
};

string hydrator::data::serializeRequest(const string& subscriptionId, const vector<Filters>& filters)
{
    if (filters.empty())
    {
        throw invalid_argument("serializeRequest: At least one filter is required.");
    }

    json jarr = json::array({ "REQ", subscriptionId });
    for (const auto& filter : filters)
    {
        filter.validate();
        jarr.push_back(filter);
    }

    return jarr.dump();
};

string hydrator::data::generateSubscriptionId()
{
    thread_local UUIDv4::UUIDGenerator<std::mt19937_64> uuidGenerator;
    UUIDv4::UUID uuid = uuidGenerator.getUUID();
    return uuid.str();
};

string hydrator::data::serializeClose(const string& subscriptionId)
{
    json jarr = json::array({ "CLOSE", subscriptionId });
    return jarr.dump();
};

string hydrator::data::serializePublish(const Event& event)
{
    json jarr = json::array({ "EVENT", event });
    return jarr.dump();
};
