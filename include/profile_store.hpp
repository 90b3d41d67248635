/**
 * @file profile_store.hpp
 * @brief Profile persistence, import and export
 * @author route-compose Development Team
 * @date 2026
 *
 * Profiles live as YAML files named "<name>.yaml" in the profiles
 * directory. Import and export additionally understand a flat CSV format
 * with the header:
 *
 * @code
 * destination,gateway,interface,metric,group,enabled,description
 * @endcode
 */

#pragma once

#include "profile.hpp"
#include <string>
#include <vector>

namespace routecompose {

/**
 * @class ProfileStore
 * @brief Directory-backed collection of named profiles
 *
 * The static methods work on arbitrary file paths and strings and do not
 * need a store instance. Every load path validates the profile and raises
 * ValidationError when it is malformed, so a profile that reaches the
 * engine is always structurally sound.
 */
class ProfileStore {
public:
    explicit ProfileStore(std::string directory);

    /// Names of the stored profiles, sorted
    std::vector<std::string> list() const;

    /**
     * @brief Load a stored profile by name
     * @throws std::runtime_error if the profile does not exist or cannot be read
     * @throws ValidationError if the profile is malformed
     */
    Profile load(const std::string& name) const;

    /**
     * @brief Validate and write a profile under its own name
     * @throws ValidationError if the profile or its name is invalid
     * @throws std::runtime_error if the file cannot be written
     */
    void save(const Profile& profile) const;

    /// Delete a stored profile; returns false if it did not exist
    bool remove(const std::string& name) const;

    bool exists(const std::string& name) const;

    /// Path of the YAML file backing a profile name
    std::string pathFor(const std::string& name) const;

    /**
     * @brief Import a YAML or CSV file into the store under a new name
     * @return The stored profile
     */
    Profile importFile(const std::string& path, const std::string& name) const;

    /// Export a stored profile to a YAML or CSV file chosen by extension
    void exportTo(const std::string& name, const std::string& path) const;

    const std::string& directory() const { return directory_; }

    /**
     * @brief Load a profile from a file, choosing the format by extension
     *
     * ".csv" files are parsed as CSV and named after their file stem;
     * anything else is parsed as YAML. A YAML profile without a name also
     * takes the file stem.
     */
    static Profile loadFile(const std::string& path);

    /// Write a profile to a file, choosing the format by extension
    static void saveFile(const Profile& profile, const std::string& path);

    /// Parse and validate a YAML profile document
    static Profile loadFromString(const std::string& yaml_content);

    /**
     * @brief Parse and validate CSV content
     * @param content CSV text with a header row
     * @param name Name given to the resulting profile
     * @throws ValidationError on malformed rows or fields
     */
    static Profile importCsv(const std::string& content, const std::string& name);

    /// Render a profile as CSV, header first
    static std::string exportCsv(const Profile& profile);

    /// Profile names are 1-64 characters of [A-Za-z0-9._-], not starting with '.' or '-'
    static bool isValidName(const std::string& name);

    /**
     * @brief Decide whether a command-line profile argument is a file path
     * @return true if it contains '/' or ends in .yaml, .yml or .csv
     */
    static bool looksLikePath(const std::string& argument);

private:
    static bool isCsvPath(const std::string& path);
    static std::vector<std::string> splitCsvRecord(const std::string& content, std::size_t& pos, bool& ok);
    static std::string quoteCsvField(const std::string& field);
    static bool parseBool(const std::string& text, bool& value);

    std::string directory_;
};

} // namespace routecompose
