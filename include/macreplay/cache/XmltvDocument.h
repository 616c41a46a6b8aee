// Repository: MacReplay-gateway
// Component: XMLTV Document
// Purpose: Builds the XMLTV guide and merges it with the previously published guide.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_CACHE_XMLTV_DOCUMENT_H_
#define MACREPLAY_CACHE_XMLTV_DOCUMENT_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "macreplay/config/GatewayConfig.h"
#include "macreplay/portal/PortalTypes.h"

namespace macreplay::cache {

struct XmltvChannel {
  std::string id;
  std::string display_name;
  std::string icon;  // Omitted from the output when empty.
};

struct XmltvProgramme {
  std::string channel;
  int64_t start_utc_s = 0;
  int64_t stop_utc_s = 0;
  std::string title;
  std::string description;
};

struct XmltvListing {
  std::vector<XmltvChannel> channels;
  std::vector<XmltvProgramme> programmes;
};

// "YYYYmmddHHMMSS +0000".
std::string FormatXmltvTime(int64_t utc_s);

// Parses the timestamp part of an XMLTV time; the zone suffix is ignored.
std::optional<int64_t> ParseXmltvTime(const std::string& text);

// Adds one portal's enabled channels and programmes to `listing`. Programme
// times are shifted by the portal's EPG offset; programmes starting at or
// before `cutoff_utc_s` are dropped. Channels without programme data get a
// 24 hour placeholder starting at the hour of `now_utc_s`. The channel id is
// the custom EPG id, else the channel number.
void AppendPortalListing(const config::Portal& portal,
                         const std::vector<portal::Channel>& channels,
                         const portal::EpgData& epg, int64_t now_utc_s, int64_t cutoff_utc_s,
                         XmltvListing& listing);

// Serializes `listing` as an XMLTV document. Programmes of
// `previous_document` whose stop time is at or after `cutoff_utc_s` and that
// are not identical to a fresh programme are carried over after the fresh
// ones. An unparsable previous document is ignored.
std::string BuildXmltvDocument(const XmltvListing& listing,
                               const std::string& previous_document, int64_t cutoff_utc_s);

}  // namespace macreplay::cache

#endif  // MACREPLAY_CACHE_XMLTV_DOCUMENT_H_
