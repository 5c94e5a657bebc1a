#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace cvpress {

struct Location {
    std::string address;
    std::string postal_code;
    std::string city;
    std::string region;
    std::string country_code;
};

struct Profile {
    std::string network;             // e.g. GitHub
    std::string username;
    std::string url;
};

struct Basics {
    std::string name;
    std::string label;               // e.g. "Backend Engineer"
    std::string email;
    std::string phone;
    std::string url;
    std::string summary;
    Location location;
    std::vector<Profile> profiles;
};

struct WorkEntry {
    std::string name;                // company
    std::string position;
    std::string location;
    std::string url;
    std::string start_date;
    std::string end_date;
    std::string summary;
    std::vector<std::string> highlights;
};

struct EducationEntry {
    std::string institution;
    std::string area;
    std::string study_type;
    std::string start_date;
    std::string end_date;
    std::string score;
    std::vector<std::string> courses;
};

struct ProjectEntry {
    std::string name;
    std::string description;
    std::string url;
    std::string start_date;
    std::string end_date;
    std::vector<std::string> highlights;
    std::vector<std::string> keywords;
};

struct SkillEntry {
    std::string name;
    std::string level;
    std::vector<std::string> keywords;
};

// Top-level data outside the core schema, kept in encounter order.
struct ExtraSection {
    std::string key;
    std::string title;
    nlohmann::ordered_json value;
};

// Empty strings mean "absent"; the context builder drops them.
struct ResumeContent {
    Basics basics;
    std::vector<WorkEntry> work;
    std::vector<EducationEntry> education;
    std::vector<ProjectEntry> projects;
    std::vector<SkillEntry> skills;
    std::vector<ExtraSection> extra_sections;
};

}  // namespace cvpress
