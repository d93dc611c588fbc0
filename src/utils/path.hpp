/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_PATH_HPP_INCLUDED__
#define __ZXFER_PATH_HPP_INCLUDED__

#include <string>

namespace zxfer
{
//  Returns the last component of a local path ("dir/a.bin" -> "a.bin").
std::string base_name (const std::string &path_);

//  Reduces a file name received from a peer to a name that stays inside
//  the destination directory. Everything up to the last '/' or '\' is
//  dropped. Returns -1 with errno EPROTO if nothing usable remains (empty,
//  ".", "..") or the name contains a NUL byte.
int sanitize_filename (const std::string &name_, std::string &out_);

//  Joins a directory and a file name with a single separator.
std::string join_path (const std::string &dir_, const std::string &name_);
}

#endif
