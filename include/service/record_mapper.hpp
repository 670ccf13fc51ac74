#pragma once

#include <string>

#include "data/data.hpp"
#include "data/records.hpp"

namespace hydrator
{
namespace service
{
/**
 * @brief Maps an event to the domain record for its kind.
 * @param event A verified event.
 * @param sourceRelay The relay from which the event was received.
 * @returns An `Article`, `Comment`, `Highlight`, or `Media` for the kinds that have one, and a
 * `GenericEvent` for every other kind.
 * @throws `InvalidEventError` if the event is of a mapped kind but its content or tags make it
 * unusable, e.g. a highlight with no content.
 * @remark The mapping functions are pure.  They read only the event's tags and content.
 */
data::DomainRecord mapRecord(const data::Event& event, const std::string& sourceRelay);

data::Article mapArticle(const data::Event& event, const std::string& sourceRelay);

/**
 * @remark The first occurrence of each reference tag wins.
 */
data::Comment mapComment(const data::Event& event, const std::string& sourceRelay);

data::Highlight mapHighlight(const data::Event& event, const std::string& sourceRelay);

/**
 * @remark The media URL is taken from the first `url` or `image` tag, falling back to the
 * content when the content is an http(s) URL.
 */
data::Media mapMedia(const data::Event& event, const std::string& sourceRelay);

data::GenericEvent mapGenericEvent(const data::Event& event, const std::string& sourceRelay);
} // namespace service
} // namespace hydrator
