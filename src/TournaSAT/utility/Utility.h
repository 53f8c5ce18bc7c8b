/*
    This file is part of the TournaSAT project.

    Copyright (C) 2024

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#pragma once

#include "TournaSAT/scheduler/Schedule.h"
#include <ostream>
#include <string>
#include <vector>

namespace TournaSAT {
/*!
 * \brief The Utility class use this class for utility functions
 */
  class Utility {
  public:
    /*!
     * print the schedule as a period x week table
     * @param schedule
     * @param stream
     * @param align minimum width of a table cell
     */
    static void printSchedule(const Schedule &schedule, std::ostream &stream, int align = 8);

    /*!
     * CASE INSENSITIVE comparisons of two strings for equality
     * @param s1 first string
     * @param s2 second string
     * @return s1 == s2
     */
    static bool iequals(const std::string &s1, const std::string &s2);

    /*!
     * split a string at every occurrence of the delimiter, empty segments are skipped
     * @param s
     * @param delimiter
     * @return the segments
     */
    static std::vector<std::string> splitString(const std::string &s, char delimiter);
  };
}
