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

#include "TournaSAT/utility/Utility.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace TournaSAT {

	void Utility::printSchedule(const Schedule &schedule, std::ostream &stream, int align) {
		stream << "\t";
		for (int w = 1; w <= schedule.getNumWeeks(); w++) {
			stream << "Week " << w << "\t";
		}
		stream << std::endl;
		for (int p = 1; p <= schedule.getNumPeriods(); p++) {
			stream << "Period " << p << "\t";
			for (int w = 1; w <= schedule.getNumWeeks(); w++) {
				auto &m = schedule.getMatch(w, p);
				std::string cell = "-----";
				if (!m.isEmpty()) {
					cell = std::to_string(m.home) + " v " + std::to_string(m.away);
				}
				stream << std::left << std::setw(align) << cell << std::right << "\t";
			}
			stream << std::endl;
		}
	}

	bool Utility::iequals(const std::string &s1, const std::string &s2) {
		if (s1.size() != s2.size()) return false;
		return std::equal(s1.begin(), s1.end(), s2.begin(), [](char a, char b) {
			return std::tolower((unsigned char)a) == std::tolower((unsigned char)b);
		});
	}

	std::vector<std::string> Utility::splitString(const std::string &s, char delimiter) {
		std::vector<std::string> segments;
		std::string segment;
		std::stringstream stream(s);
		while (std::getline(stream, segment, delimiter)) {
			if (segment.empty()) continue;
			segments.emplace_back(segment);
		}
		return segments;
	}
}
