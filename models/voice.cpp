#include "wisteria/models/voice.hpp"

namespace wisteria::models
{

json_utils::Decoded<VoiceState> VoiceState::from_json(const boost::json::value& jv)
{
    auto rd = json_utils::Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    VoiceState vs;
    vs.guild_id = rd->optional<Snowflake>("guild_id");
    vs.channel_id = rd->optional<Snowflake>("channel_id");
    vs.user_id = rd->required<Snowflake>("user_id");
    vs.member = rd->optional<GuildMember>("member");
    vs.session_id = rd->required<std::string>("session_id");
    vs.deaf = rd->required<bool>("deaf");
    vs.mute = rd->required<bool>("mute");
    vs.self_deaf = rd->required<bool>("self_deaf");
    vs.self_mute = rd->required<bool>("self_mute");
    vs.self_stream = rd->optional<bool>("self_stream");
    vs.self_video = rd->required<bool>("self_video");
    vs.suppress = rd->required<bool>("suppress");
    return rd->finish(std::move(vs));
}

} // namespace wisteria::models
