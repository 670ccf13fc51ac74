#pragma once

namespace hydrator
{
namespace data
{
/**
 * @brief Event kinds with a dedicated projection, plus a few that are commonly hydrated as
 * generic events.
 */
enum Kind : int
{
    METADATA = 0, ///< NIP-01
    TEXT_NOTE = 1, ///< NIP-01
    PICTURE = 20, ///< NIP-68
    VIDEO = 21, ///< NIP-71, horizontal video
    SHORT_VIDEO = 22, ///< NIP-71, vertical video
    COMMENT = 1111, ///< NIP-22
    ZAP_RECEIPT = 9735, ///< NIP-57
    HIGHLIGHT = 9802, ///< NIP-84
    RELAY_LIST = 10002, ///< NIP-65
    CURATION_SET = 30004, ///< NIP-51
    LONGFORM = 30023, ///< NIP-23
    LONGFORM_DRAFT = 30024, ///< NIP-23
    PUBLICATION_INDEX = 30040, ///< NKBIP-01
    PUBLICATION_CONTENT = 30041 ///< NKBIP-01
};

inline bool isArticleKind(int kind)
{
    return kind == LONGFORM || kind == LONGFORM_DRAFT;
}

inline bool isMediaKind(int kind)
{
    return kind == PICTURE || kind == VIDEO || kind == SHORT_VIDEO;
}
} // namespace data
} // namespace hydrator
