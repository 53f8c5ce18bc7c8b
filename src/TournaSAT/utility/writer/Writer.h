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
#include <string>

namespace TournaSAT
{
/*!
 * \brief Writer base class of the DIMACS and schedule writers
 */
class Writer
{
public:
  /*!
   * \brief Writer
   * \param path output file, overwritten by write()
   */
  Writer(std::string path);
  virtual ~Writer();
  /*!
   * \brief write the content to path, throws TournaSAT::Exception if the file can't be opened
   */
  virtual void write() = 0;
  const std::string &getPath() const { return this->path; }
protected:
  std::string path;
};

}
