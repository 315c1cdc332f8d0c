#ifndef VLC_CORE_CONFIG_HPP
#define VLC_CORE_CONFIG_HPP

#include <google/protobuf/message.h>
#include <string>

namespace vlc {
namespace core {

/*!
 * Parses protobuf text format from path into message.
 *
 * Throws error::vlc_exception of type "config_error" if the file
 *  can't be read or doesn't parse.
 */
void load_config(const std::string & path, google::protobuf::Message & message);

/// As load_config, from an in-memory string
void parse_config(const std::string & text, google::protobuf::Message & message);

/// Reads an entire file (keys, certificates); throws "config_error"
std::string read_file(const std::string & path);

template<typename Message>
Message load_config(const std::string & path)
{
    Message message;
    load_config(path, message);
    return message;
}

}
}

#endif
