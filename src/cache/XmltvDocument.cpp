// Repository: MacReplay-gateway
// Component: XMLTV Document
// Purpose: Builds the XMLTV guide and merges it with the previously published guide.
// Copyright (c) 2025 MacReplay

#include "macreplay/cache/XmltvDocument.h"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <cctype>
#include <ctime>
#include <memory>
#include <set>

#include "macreplay/util/Logger.hpp"

namespace macreplay::cache {

using macreplay::util::Logger;

namespace {

constexpr int64_t kSecondsPerHour = 3600;
constexpr int64_t kPlaceholderHours = 24;

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

struct XmlBufferDeleter {
  void operator()(xmlBuffer* buffer) const { xmlBufferFree(buffer); }
};

const xmlChar* X(const char* text) { return reinterpret_cast<const xmlChar*>(text); }
const xmlChar* X(const std::string& text) { return X(text.c_str()); }

// Element with a text child; an empty string yields an empty element so the
// serialized form survives a parse round trip unchanged.
void AddTextElement(xmlNode* parent, const char* name, const std::string& text) {
  if (text.empty()) {
    xmlNewChild(parent, nullptr, X(name), nullptr);
  } else {
    xmlNewTextChild(parent, nullptr, X(name), X(text));
  }
}

std::string NodeToString(xmlDoc* doc, xmlNode* node) {
  std::unique_ptr<xmlBuffer, XmlBufferDeleter> buffer(xmlBufferCreate());
  if (!buffer) return "";
  xmlNodeDump(buffer.get(), doc, node, 0, 0);
  return std::string(reinterpret_cast<const char*>(xmlBufferContent(buffer.get())),
                     static_cast<size_t>(xmlBufferLength(buffer.get())));
}

bool IsBlank(const xmlChar* text) {
  if (!text) return true;
  for (; *text; ++text) {
    if (!std::isspace(*text)) return false;
  }
  return true;
}

// Drops indentation text between elements left over from pretty printing.
void StripIndentation(xmlNode* node) {
  bool has_element_child = false;
  for (xmlNode* child = node->children; child; child = child->next) {
    if (child->type == XML_ELEMENT_NODE) has_element_child = true;
  }
  xmlNode* child = node->children;
  while (child) {
    xmlNode* next = child->next;
    if (has_element_child && child->type == XML_TEXT_NODE && IsBlank(child->content)) {
      xmlUnlinkNode(child);
      xmlFreeNode(child);
    } else if (child->type == XML_ELEMENT_NODE) {
      StripIndentation(child);
    }
    child = next;
  }
}

std::string GetAttribute(xmlNode* node, const char* name) {
  xmlChar* value = xmlGetProp(node, X(name));
  if (!value) return "";
  std::string out(reinterpret_cast<const char*>(value));
  xmlFree(value);
  return out;
}

xmlNode* AddProgramme(xmlNode* tv, const XmltvProgramme& programme) {
  xmlNode* node = xmlNewChild(tv, nullptr, X("programme"), nullptr);
  xmlNewProp(node, X("start"), X(FormatXmltvTime(programme.start_utc_s)));
  xmlNewProp(node, X("stop"), X(FormatXmltvTime(programme.stop_utc_s)));
  xmlNewProp(node, X("channel"), X(programme.channel));
  AddTextElement(node, "title", programme.title);
  AddTextElement(node, "desc", programme.description);
  return node;
}

}  // namespace

std::string FormatXmltvTime(int64_t utc_s) {
  const std::time_t t = static_cast<std::time_t>(utc_s);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d%H%M%S", &tm);
  return std::string(buf) + " +0000";
}

std::optional<int64_t> ParseXmltvTime(const std::string& text) {
  if (text.size() < 14) return std::nullopt;
  for (size_t i = 0; i < 14; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
  }
  auto field = [&](size_t pos, size_t len) { return std::stoi(text.substr(pos, len)); };
  std::tm tm{};
  tm.tm_year = field(0, 4) - 1900;
  tm.tm_mon = field(4, 2) - 1;
  tm.tm_mday = field(6, 2);
  tm.tm_hour = field(8, 2);
  tm.tm_min = field(10, 2);
  tm.tm_sec = field(12, 2);
  return static_cast<int64_t>(timegm(&tm));
}

void AppendPortalListing(const config::Portal& portal,
                         const std::vector<portal::Channel>& channels,
                         const portal::EpgData& epg, int64_t now_utc_s, int64_t cutoff_utc_s,
                         XmltvListing& listing) {
  const int64_t offset_s = static_cast<int64_t>(portal.epg_offset_hours) * kSecondsPerHour;

  for (const auto& channel : channels) {
    if (!portal.IsChannelEnabled(channel.id)) continue;

    auto custom_name = portal.custom_names.find(channel.id);
    const std::string name =
        custom_name != portal.custom_names.end() ? custom_name->second : channel.name;
    auto custom_number = portal.custom_numbers.find(channel.id);
    const std::string number =
        custom_number != portal.custom_numbers.end() ? custom_number->second : channel.number;
    auto custom_epg = portal.custom_epg_ids.find(channel.id);
    const std::string epg_id =
        custom_epg != portal.custom_epg_ids.end() ? custom_epg->second : number;

    listing.channels.push_back(XmltvChannel{epg_id, name, channel.logo});

    auto data = epg.find(channel.id);
    if (data == epg.end() || data->second.empty()) {
      Logger::Warn("[XmltvDocument] No EPG data for channel " + name + " (ID: " + channel.id +
                   "), adding a placeholder");
      XmltvProgramme placeholder;
      placeholder.channel = epg_id;
      placeholder.start_utc_s = now_utc_s - (now_utc_s % kSecondsPerHour);
      placeholder.stop_utc_s = placeholder.start_utc_s + kPlaceholderHours * kSecondsPerHour;
      placeholder.title = name;
      placeholder.description = name;
      listing.programmes.push_back(std::move(placeholder));
      continue;
    }

    for (const auto& item : data->second) {
      XmltvProgramme programme;
      programme.channel = epg_id;
      programme.start_utc_s = item.start_timestamp + offset_s;
      programme.stop_utc_s = item.stop_timestamp + offset_s;
      if (programme.start_utc_s <= cutoff_utc_s) continue;
      programme.title = item.name;
      programme.description = item.description;
      listing.programmes.push_back(std::move(programme));
    }
  }
}

std::string BuildXmltvDocument(const XmltvListing& listing,
                               const std::string& previous_document, int64_t cutoff_utc_s) {
  XmlDocPtr doc(xmlNewDoc(X("1.0")));
  xmlNode* tv = xmlNewNode(nullptr, X("tv"));
  xmlDocSetRootElement(doc.get(), tv);

  for (const auto& channel : listing.channels) {
    xmlNode* node = xmlNewChild(tv, nullptr, X("channel"), nullptr);
    xmlNewProp(node, X("id"), X(channel.id));
    AddTextElement(node, "display-name", channel.display_name);
    if (!channel.icon.empty()) {
      xmlNode* icon = xmlNewChild(node, nullptr, X("icon"), nullptr);
      xmlNewProp(icon, X("src"), X(channel.icon));
    }
  }

  std::set<std::string> published;
  for (const auto& programme : listing.programmes) {
    xmlNode* node = AddProgramme(tv, programme);
    published.insert(NodeToString(doc.get(), node));
  }

  size_t carried = 0;
  if (!previous_document.empty()) {
    XmlDocPtr previous(xmlReadMemory(previous_document.data(),
                                     static_cast<int>(previous_document.size()), nullptr,
                                     "UTF-8",
                                     XML_PARSE_NOBLANKS | XML_PARSE_NONET |
                                         XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    xmlNode* root = previous ? xmlDocGetRootElement(previous.get()) : nullptr;
    if (!root) {
      Logger::Warn("[XmltvDocument] Previous guide could not be parsed, not merging");
    } else {
      for (xmlNode* node = root->children; node; node = node->next) {
        if (node->type != XML_ELEMENT_NODE ||
            xmlStrcmp(node->name, X("programme")) != 0) {
          continue;
        }
        const auto stop = ParseXmltvTime(GetAttribute(node, "stop"));
        if (!stop || *stop < cutoff_utc_s) continue;

        StripIndentation(node);
        const std::string serialized = NodeToString(previous.get(), node);
        if (!published.insert(serialized).second) continue;

        xmlNode* copy = xmlDocCopyNode(node, doc.get(), 1);
        if (copy) {
          xmlAddChild(tv, copy);
          ++carried;
        }
      }
    }
  }
  Logger::Debug("[XmltvDocument] " + std::to_string(listing.programmes.size()) +
                " fresh and " + std::to_string(carried) + " carried programmes");

  xmlChar* memory = nullptr;
  int size = 0;
  xmlDocDumpFormatMemoryEnc(doc.get(), &memory, &size, "UTF-8", 1);
  if (!memory) return "";
  std::string out(reinterpret_cast<const char*>(memory), static_cast<size_t>(size));
  xmlFree(memory);
  return out;
}

}  // namespace macreplay::cache
