#include "vlc/core/config.hpp"
#include "vlc/error.hpp"
#include "vlc/log.hpp"
#include <google/protobuf/text_format.h>
#include <fstream>
#include <sstream>

namespace vlc {
namespace core {

std::string read_file(const std::string & path)
{
    std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
    if(!in)
    {
        throw error::vlc_exception("config_error",
            "failed to open " + log::ascii_escape(path));
    }

    std::stringstream content;
    content << in.rdbuf();
    return content.str();
}

void parse_config(const std::string & text,
    google::protobuf::Message & message)
{
    if(!google::protobuf::TextFormat::ParseFromString(text, &message))
    {
        throw error::vlc_exception("config_error",
            "failed to parse " + message.GetTypeName());
    }
}

void load_config(const std::string & path,
    google::protobuf::Message & message)
{
    parse_config(read_file(path), message);

    LOG_INFO("loaded " << message.GetTypeName() << " from " << path
        << ":\n" << message.DebugString());
}

}
}
