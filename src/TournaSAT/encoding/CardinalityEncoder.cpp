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

#include "CardinalityEncoder.h"
#include <TournaSAT/utility/Exception.h>
#include <string>

namespace TournaSAT {

	CardinalityEncoding CardinalityEncoder::atMost(const std::vector<int> &literals, int bound, LiteralCounter &counter) {
		CardinalityEncoding enc;
		auto m = (int)literals.size();
		if (bound < 0) {
			throw EncodingError("CardinalityEncoder: negative bound " + std::to_string(bound));
		}
		for (auto &l : literals) {
			if (l == 0) throw EncodingError("CardinalityEncoder: literal 0 is not allowed");
		}
		if (bound >= m) return enc;
		if (bound == 0) {
			for (auto &l : literals) enc.clauses.push_back({-l});
			return enc;
		}

		// s[i][j] is stored at s[i-1][j-1]
		std::vector<std::vector<int>> s((unsigned int)m - 1, std::vector<int>((unsigned int)bound));
		for (int i = 0; i < m - 1; i++) {
			for (int j = 0; j < bound; j++) {
				s[i][j] = counter.getFreshVariable();
				enc.auxiliaryVariables.emplace_back(s[i][j]);
			}
		}

		// first literal
		enc.clauses.push_back({-literals[0], s[0][0]});
		for (int j = 1; j < bound; j++) {
			enc.clauses.push_back({-s[0][j]});
		}
		for (int i = 1; i < m - 1; i++) {
			auto x = literals[i];
			enc.clauses.push_back({-x, s[i][0]});
			enc.clauses.push_back({-s[i - 1][0], s[i][0]});
			for (int j = 1; j < bound; j++) {
				enc.clauses.push_back({-x, -s[i - 1][j - 1], s[i][j]});
				enc.clauses.push_back({-s[i - 1][j], s[i][j]});
			}
			// overflow
			enc.clauses.push_back({-x, -s[i - 1][bound - 1]});
		}
		// last literal only needs the overflow check
		enc.clauses.push_back({-literals[m - 1], -s[m - 2][bound - 1]});
		return enc;
	}
}
