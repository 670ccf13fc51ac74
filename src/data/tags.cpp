#include <cctype>
#include <cstdlib>

#include "data/tags.hpp"

using namespace hydrator::data;
using namespace std;

namespace
{
string at(const vector<string>& raw, size_t index)
{
    return raw.size() > index ? raw[index] : string();
}

bool parseInteger(const string& value, long long& result)
{
    if (value.empty())
    {
        return false;
    }

    char* end = nullptr;
    result = strtoll(value.c_str(), &end, 10);
    return end != nullptr && *end == '\0';
}

Scope scopeOf(const string& name)
{
    return isupper(static_cast<unsigned char>(name[0])) ? Scope::Root : Scope::Parent;
}
} // namespace

Tag hydrator::data::parseTag(const vector<string>& raw)
{
    if (raw.empty())
    {
        return UnknownTag{ raw };
    }

    const string& name = raw[0];

    // A content warning is meaningful even without a reason.
    if (name == "content-warning")
    {
        return ContentWarningTag{ at(raw, 1) };
    }

    if (raw.size() < 2)
    {
        return UnknownTag{ raw };
    }

    const string& value = raw[1];

    if (name == "d")
    {
        return IdentifierTag{ value };
    }
    if (name == "title")
    {
        return TitleTag{ value };
    }
    if (name == "summary")
    {
        return SummaryTag{ value };
    }
    if (name == "image")
    {
        return ImageTag{ value };
    }
    if (name == "published_at")
    {
        long long timestamp;
        if (parseInteger(value, timestamp) && timestamp > 0)
        {
            return PublishedAtTag{ static_cast<time_t>(timestamp) };
        }
        return UnknownTag{ raw };
    }
    if (name == "t")
    {
        return TopicTag{ value };
    }
    if (name == "url")
    {
        return UrlTag{ value };
    }
    if (name == "m")
    {
        return MimeTypeTag{ value };
    }
    if (name == "context")
    {
        return ContextTag{ value };
    }
    if (name == "L")
    {
        return LabelNamespaceTag{ value };
    }
    if (name == "r")
    {
        return WebReferenceTag{ value };
    }
    if (name == "e" || name == "E")
    {
        return EventReferenceTag{ scopeOf(name), value, at(raw, 2) };
    }
    if (name == "a" || name == "A")
    {
        return AddressReferenceTag{ scopeOf(name), value, at(raw, 2) };
    }
    if (name == "k" || name == "K")
    {
        long long kind;
        if (parseInteger(value, kind) && kind >= 0 && kind <= 65535)
        {
            return KindReferenceTag{ scopeOf(name), static_cast<int>(kind) };
        }
        return UnknownTag{ raw };
    }
    if (name == "p" || name == "P")
    {
        return PubkeyReferenceTag{ scopeOf(name), value, at(raw, 2) };
    }

    return UnknownTag{ raw };
};

vector<Tag> hydrator::data::parseTags(const vector<vector<string>>& tags)
{
    vector<Tag> parsed;
    parsed.reserve(tags.size());
    for (const auto& tag : tags)
    {
        parsed.push_back(parseTag(tag));
    }

    return parsed;
};
