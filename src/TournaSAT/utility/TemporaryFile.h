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

#ifndef TOURNASAT_TEMPORARYFILE_H
#define TOURNASAT_TEMPORARYFILE_H

#include <string>

namespace TournaSAT {
	/*!
	 * \brief TemporaryFile creates a unique empty file and removes it when it goes out of scope
	 */
	class TemporaryFile {
	public:
		/*!
		 * throws Exception if the file can not be created
		 * @param suffix appended to the generated file name (e.g. ".cnf")
		 */
		explicit TemporaryFile(const std::string &suffix = "");
		~TemporaryFile();
		TemporaryFile(const TemporaryFile &) = delete;
		TemporaryFile &operator=(const TemporaryFile &) = delete;

		const std::string &getPath() const { return this->path; }
	private:
		std::string path;
	};
}

#endif //TOURNASAT_TEMPORARYFILE_H
