/**
 * @file page.hpp
 * @brief Paginated list results and Link header parsing.
 */
#ifndef OCTOCLIENT_PAGE_HPP
#define OCTOCLIENT_PAGE_HPP

#include "response.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace octo {

/// Navigation targets advertised by a `Link` header.
struct Links {
  std::optional<std::string> next;
  std::optional<std::string> prev;
  std::optional<std::string> first;
  std::optional<std::string> last;
};

/**
 * Parse a `Link` header such as
 * `<https://api.github.com/x?page=2>; rel="next", <...>; rel="last"`.
 *
 * Entries without angle brackets, with an empty or non-http URL, or without a
 * `rel` are skipped. Unknown relations are ignored.
 */
Links parse_link_header(const std::string &value);

/// Value of query parameter @p name in @p url, if present.
std::optional<std::string> query_param(const std::string &url,
                                       const std::string &name);

/**
 * Locate the item array of a list response.
 *
 * Arrays are returned as-is; objects yield the first of `items`, `workflows`,
 * `workflow_runs`, `jobs`, `artifacts`, `repositories`, `installations` or
 * `runners` that holds an array.
 *
 * @return Pointer into @p body, or nullptr when no item array exists.
 */
const nlohmann::json *page_items(const nlohmann::json &body);

/**
 * One page of a list endpoint.
 */
template <typename T> struct Page {
  std::vector<T> items;
  std::optional<std::string> next;
  std::optional<std::string> prev;
  std::optional<std::string> first;
  std::optional<std::string> last;
  std::optional<std::uint64_t> total_count; ///< Search and wrapped lists
  std::optional<bool> incomplete_results;   ///< Search results only

  /// Move the items out, leaving the page empty.
  std::vector<T> take_items() { return std::exchange(items, {}); }

  /// Number of pages according to the `page` parameter of the last link.
  std::optional<std::uint64_t> number_of_pages() const {
    if (!last) {
      return std::nullopt;
    }
    auto page = query_param(*last, "page");
    if (!page) {
      return std::nullopt;
    }
    try {
      return std::stoull(*page);
    } catch (const std::exception &) {
      return std::nullopt;
    }
  }

  bool has_next() const { return next.has_value(); }

  typename std::vector<T>::iterator begin() { return items.begin(); }
  typename std::vector<T>::iterator end() { return items.end(); }
  typename std::vector<T>::const_iterator begin() const {
    return items.begin();
  }
  typename std::vector<T>::const_iterator end() const { return items.end(); }
};

template <typename T> struct FromResponse<Page<T>> {
  static Page<T> decode(const HttpResponse &response) {
    nlohmann::json body = nlohmann::json::parse(response.body);
    const nlohmann::json *items = page_items(body);
    if (items == nullptr) {
      throw std::runtime_error("Response is not a list");
    }
    Page<T> page;
    page.items = items->template get<std::vector<T>>();
    if (body.is_object()) {
      if (body.contains("total_count") && body["total_count"].is_number()) {
        page.total_count = body["total_count"].template get<std::uint64_t>();
      }
      if (body.contains("incomplete_results") &&
          body["incomplete_results"].is_boolean()) {
        page.incomplete_results = body["incomplete_results"].template get<bool>();
      }
    }
    if (auto link = response.header("Link")) {
      Links links = parse_link_header(*link);
      page.next = std::move(links.next);
      page.prev = std::move(links.prev);
      page.first = std::move(links.first);
      page.last = std::move(links.last);
    }
    return page;
  }
};

} // namespace octo

#endif // OCTOCLIENT_PAGE_HPP
