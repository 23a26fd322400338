#include "problem_parser.h"
#include "errors.h"

using json = nlohmann::json;

namespace blm
{

    static std::vector<Participant> parse_side(const json &side, const char *key)
    {
        std::vector<Participant> out;
        if (side.is_array())
        {
            for (const auto &id : side)
                out.push_back(Participant{id.get<std::string>(), 1});
            return out;
        }
        if (!side.is_object())
            throw InvalidInputError(std::string("'") + key + "' must be an object or an array.");
        for (auto it = side.begin(); it != side.end(); ++it)
        {
            Participant p{it.key(), 1};
            if (it.value().is_object() && it.value().contains("max"))
            {
                const auto &max = it.value()["max"];
                if (!max.is_number_integer())
                    throw InvalidInputError(p.id + ": 'max' must be an integer.");
                p.capacity = max.get<int>();
            }
            out.push_back(std::move(p));
        }
        return out;
    }

    static PreferenceList parse_list(const std::string &owner, const json &v, bool partial)
    {
        if (v.is_array())
        {
            std::vector<std::string> order;
            order.reserve(v.size());
            for (const auto &c : v)
                order.push_back(c.get<std::string>());
            return PreferenceList::ordered(std::move(order));
        }
        if (v.is_object())
        {
            std::map<std::string, int> ranks;
            for (auto it = v.begin(); it != v.end(); ++it)
            {
                if (!it.value().is_number_integer())
                    throw InvalidInputError(owner + ": rank of " + it.key() + " must be an integer.");
                ranks[it.key()] = it.value().get<int>();
            }
            return PreferenceList::ranked(std::move(ranks), partial);
        }
        throw InvalidInputError(owner + ": preferences must be a list or a rank map.");
    }

    static PreferenceMap parse_prefs(const json &prefs, const char *key, bool partial)
    {
        if (!prefs.is_object())
            throw InvalidInputError(std::string("'") + key + "' must be an object.");
        PreferenceMap out;
        for (auto it = prefs.begin(); it != prefs.end(); ++it)
            out.emplace(it.key(), parse_list(it.key(), it.value(), partial));
        return out;
    }

    MatchingProblem problem_from_json(const json &j, Variant variant)
    {
        const bool partial = !requires_complete_lists(variant);
        MatchingProblem p;
        try
        {
            p.proposers = parse_side(j.at("bigs"), "bigs");
            p.receivers = parse_side(j.at("littles"), "littles");
            p.proposer_prefs = parse_prefs(j.at("big_prefs"), "big_prefs", partial);
            p.receiver_prefs = parse_prefs(j.at("little_prefs"), "little_prefs", partial);
        }
        catch (const json::exception &e)
        {
            throw InvalidInputError(std::string("malformed problem file: ") + e.what());
        }
        return p;
    }

    static json list_to_json(const PreferenceList &l)
    {
        if (l.kind == PreferenceKind::kTotalOrder)
            return l.order;
        json obj = json::object();
        for (const auto &kv : l.ranks)
            obj[kv.first] = kv.second;
        return obj;
    }

    json problem_to_json(const MatchingProblem &problem)
    {
        json j;
        for (const auto &b : problem.proposers)
            j["bigs"][b.id] = {{"max", b.capacity}};
        for (const auto &l : problem.receivers)
            j["littles"][l.id] = {{"max", l.capacity}};
        j["big_prefs"] = json::object();
        j["little_prefs"] = json::object();
        for (const auto &kv : problem.proposer_prefs)
            j["big_prefs"][kv.first] = list_to_json(kv.second);
        for (const auto &kv : problem.receiver_prefs)
            j["little_prefs"][kv.first] = list_to_json(kv.second);
        return j;
    }

} // namespace blm
