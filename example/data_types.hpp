#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Page workflow
struct PageConfig {
  std::string pdf_page;
};

struct PageData {
  std::vector<std::string> visual_information;
  std::vector<std::string> extracted_text;
  std::string parameter1;
  std::string parameter2;
  std::string parameter3;
};

inline void to_json(nlohmann::json& j, const PageData& d) {
  j = nlohmann::json{{"visual_information", d.visual_information},
                     {"extracted_text", d.extracted_text},
                     {"parameter1", d.parameter1},
                     {"parameter2", d.parameter2},
                     {"parameter3", d.parameter3}};
}

inline void from_json(const nlohmann::json& j, PageData& d) {
  j.at("visual_information").get_to(d.visual_information);
  j.at("extracted_text").get_to(d.extracted_text);
  j.at("parameter1").get_to(d.parameter1);
  j.at("parameter2").get_to(d.parameter2);
  j.at("parameter3").get_to(d.parameter3);
}

// Document workflow
struct DocumentConfig {
  std::vector<std::string> pdf_pages;
};

// Input of one PageAnalysis component
struct PageInput {
  int index = 0;
};

// pages[i] stays null until page i has been analysed
struct DocumentData {
  std::vector<std::shared_ptr<PageData>> pages;
  bool all_pages_done = false;
};

inline void to_json(nlohmann::json& j, const DocumentData& d) {
  nlohmann::json pages = nlohmann::json::array();
  for (const auto& page : d.pages) {
    if (page) {
      pages.push_back(*page);
    } else {
      pages.push_back(nullptr);
    }
  }
  j = nlohmann::json{{"pages", std::move(pages)},
                     {"all_pages_done", d.all_pages_done}};
}
