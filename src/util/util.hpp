/**
 * Carpool route matching.
 *
 * Utility functions shared by the library and the command line program
 */

#ifndef POOLMATCH_UTIL_UTIL_HPP
#define POOLMATCH_UTIL_UTIL_HPP

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace POOLMATCH
{
  /**
   * Utility functions
   */
  namespace UTIL
  {
    /**
     * Wall clock time point used for timing program steps
     */
    typedef std::chrono::system_clock::time_point TimePoint;

    /**
     * Get current time
     * @return current time point
     */
    TimePoint get_current_time();

    /**
     * Calculate the duration between two timepoints
     * @param t1 start time
     * @param t2 end time
     * @return duration in seconds
     */
    double get_duration(const TimePoint &t1, const TimePoint &t2);

    /**
     * Check if a file exists
     * @param filename file name
     * @return true if the file exists
     */
    bool file_exists(const std::string &filename);

    /**
     * Split a string with a delimiter
     * @param str input string
     * @param delim delimiter, comma by default
     * @return the fields of the string
     */
    std::vector<std::string> split_string(const std::string &str, char delim = ',');

    /**
     * Remove leading and trailing white space
     */
    std::string trim(const std::string &str);

    /**
     * Check if the extension of a file name is in a list of extensions
     * @param filename file name
     * @param extension_list_str comma separated extensions, e.g. "csv,txt"
     * @return true if the extension is in the list
     */
    bool check_file_extension(const std::string &filename,
                              const std::string &extension_list_str);

    /**
     * Check if a folder exists, an empty folder name refers to the
     * working directory
     */
    bool folder_exist(const std::string &folder_name);

    /**
     * Get the directory part of a file name
     */
    std::string get_file_directory(const std::string &fn);

    /**
     * Read a line (or a field delimited by delim) handling \n, \r and \r\n
     * line endings
     */
    std::istream &safe_get_line(std::istream &is, std::string &t, char delim = '\n');

    /**
     * Resolve a configured worker count, where a value smaller than 1
     * stands for the number of available processing units
     * @param requested configured value
     * @return number of workers, at least 1
     */
    int resolve_concurrency(int requested);

  } // UTIL
} // POOLMATCH

#endif // POOLMATCH_UTIL_UTIL_HPP
