/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/path.hpp"

std::string zxfer::base_name (const std::string &path_)
{
    const std::string::size_type pos = path_.find_last_of ('/');
    if (pos == std::string::npos)
        return path_;
    return path_.substr (pos + 1);
}

int zxfer::sanitize_filename (const std::string &name_, std::string &out_)
{
    if (name_.find ('\0') != std::string::npos) {
        errno = EPROTO;
        return -1;
    }

    const std::string::size_type pos = name_.find_last_of ("/\\");
    const std::string name =
      pos == std::string::npos ? name_ : name_.substr (pos + 1);

    if (name.empty () || name == "." || name == "..") {
        errno = EPROTO;
        return -1;
    }

    out_ = name;
    return 0;
}

std::string zxfer::join_path (const std::string &dir_,
                              const std::string &name_)
{
    if (dir_.empty ())
        return name_;
    if (dir_[dir_.size () - 1] == '/')
        return dir_ + name_;
    return dir_ + '/' + name_;
}
