#include "Core/Gateway/GatewayProtocol.hpp"

#include <stdexcept>

namespace
{
    std::optional<std::string> StringField(const boost::json::object &o, const char *key)
    {
        const boost::json::value *v = o.if_contains(key);
        if (v == nullptr || !v->is_string()) return std::nullopt;
        return boost::json::value_to<std::string>(*v);
    }

    // Ищет в массиве каналов объект с нужным id.
    std::optional<std::string> NameInChannelArray(const boost::json::value *arr,
                                                  const std::string        &channel_id)
    {
        if (arr == nullptr || !arr->is_array()) return std::nullopt;
        for (const boost::json::value &ch : arr->as_array())
        {
            if (!ch.is_object()) continue;
            const boost::json::object &co = ch.as_object();
            if (StringField(co, "id") == channel_id)
            {
                return StringField(co, "name");
            }
        }
        return std::nullopt;
    }
}

namespace Gateway
{
    Message Parse(const std::string &text)
    {
        boost::system::error_code ec;
        boost::json::value jv = boost::json::parse(text, ec);
        if (ec)
            throw std::invalid_argument("gateway frame is not JSON: " + ec.message());
        if (!jv.is_object())
            throw std::invalid_argument("gateway frame is not an object");

        boost::json::object &o = jv.as_object();

        Message msg;
        const boost::json::value *op = o.if_contains("op");
        if (op == nullptr || !op->is_int64())
            throw std::invalid_argument("gateway frame without integer 'op'");
        msg.op = static_cast<int>(op->as_int64());

        if (const boost::json::value *s = o.if_contains("s"))
        {
            if (s->is_int64())       msg.seq = s->as_int64();
            else if (s->is_uint64()) msg.seq = static_cast<std::int64_t>(s->as_uint64());
        }

        msg.type = StringField(o, "t");

        if (boost::json::value *d = o.if_contains("d"))
        {
            msg.data = std::move(*d);
        }
        return msg;
    }

    std::string BuildIdentify(const std::string &token, const IdentifyProperties &props)
    {
        boost::json::object properties;
        properties["os"]      = props.os;
        properties["browser"] = props.browser;
        properties["device"]  = props.device;

        boost::json::object d;
        d["token"]      = token;
        d["properties"] = std::move(properties);

        boost::json::object msg;
        msg["op"] = static_cast<int>(Opcode::Identify);
        msg["d"]  = std::move(d);
        return boost::json::serialize(msg);
    }

    std::string BuildHeartbeat(std::optional<std::int64_t> seq)
    {
        boost::json::object msg;
        msg["op"] = static_cast<int>(Opcode::Heartbeat);
        if (seq) msg["d"] = *seq;
        else     msg["d"] = nullptr;
        return boost::json::serialize(msg);
    }

    std::optional<std::chrono::milliseconds> HelloInterval(const Message &msg)
    {
        if (!msg.Is(Opcode::Hello) || !msg.data.is_object()) return std::nullopt;

        const boost::json::value *hb = msg.data.as_object().if_contains("heartbeat_interval");
        if (hb == nullptr) return std::nullopt;

        std::int64_t ms = 0;
        if (hb->is_int64())       ms = hb->as_int64();
        else if (hb->is_uint64()) ms = static_cast<std::int64_t>(hb->as_uint64());
        else if (hb->is_double()) ms = static_cast<std::int64_t>(hb->as_double());
        else return std::nullopt;

        if (ms <= 0) return std::nullopt;
        return std::chrono::milliseconds(ms);
    }

    std::optional<std::string> ChannelUpdateName(const boost::json::value &d,
                                                 const std::string        &channel_id)
    {
        if (!d.is_object()) return std::nullopt;
        const boost::json::object &o = d.as_object();
        if (StringField(o, "id") != channel_id) return std::nullopt;
        return StringField(o, "name");
    }

    std::optional<std::string> FindChannelName(const boost::json::value &d,
                                               const std::string        &channel_id)
    {
        if (!d.is_object()) return std::nullopt;
        const boost::json::object &o = d.as_object();

        // GUILD_CREATE: сам объект гильдии
        if (auto name = NameInChannelArray(o.if_contains("channels"), channel_id))
            return name;

        // READY
        if (auto name = NameInChannelArray(o.if_contains("private_channels"), channel_id))
            return name;

        const boost::json::value *guilds = o.if_contains("guilds");
        if (guilds != nullptr && guilds->is_array())
        {
            for (const boost::json::value &g : guilds->as_array())
            {
                if (!g.is_object()) continue;
                if (auto name = NameInChannelArray(g.as_object().if_contains("channels"), channel_id))
                    return name;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> SessionId(const boost::json::value &d)
    {
        if (!d.is_object()) return std::nullopt;
        return StringField(d.as_object(), "session_id");
    }
}
