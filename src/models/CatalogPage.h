#pragma once

#include "CatalogItem.h"
#include "../util/json/JsonValidation.h"
#include <nlohmann/json.hpp>
#include <vector>

namespace Marquee {

// ==============================================================================
/**
 * CatalogPage is one page of a paged listing or search response
 */
struct CatalogPage {
  std::vector<CatalogItem> items;
  int page = 1;
  int totalPages = 0;
  int totalResults = 0;

  /** An empty page, returned for blank searches without touching the network */
  static CatalogPage emptyPage(int page = 1) {
    CatalogPage result;
    result.page = page;
    return result;
  }

  bool empty() const {
    return items.empty();
  }

  bool hasMorePages() const {
    return page < totalPages;
  }

  std::vector<int> itemIds() const {
    std::vector<int> ids;
    ids.reserve(items.size());
    for (const auto &item : items)
      ids.push_back(item.id);
    return ids;
  }
};

// ==============================================================================
// JSON Serialization ({page, results, total_pages, total_results})

inline void to_json(nlohmann::json &j, const CatalogPage &page) {
  j = nlohmann::json{
      {"page", page.page},
      {"results", page.items},
      {"total_pages", page.totalPages},
      {"total_results", page.totalResults},
  };
}

inline void from_json(const nlohmann::json &j, CatalogPage &page) {
  JSON_OPTIONAL(j, "page", page.page, 1);
  JSON_OPTIONAL(j, "total_pages", page.totalPages, 0);
  JSON_OPTIONAL(j, "total_results", page.totalResults, 0);

  if (!j.contains("results") || !j["results"].is_array())
    throw Json::ValidationError("results", "required array is missing", j.dump());

  page.items.clear();
  page.items.reserve(j["results"].size());

  for (const auto &element : j["results"]) {
    CatalogItem item;
    from_json(element, item);
    if (!item.isValid())
      throw Json::ValidationError("results", "item without id or title", element.dump());
    page.items.push_back(std::move(item));
  }
}

} // namespace Marquee
