#include "matching_io.h"
#include "errors.h"

using json = nlohmann::json;

namespace blm
{

    // ---- Matching JSON I/O ----

    json matching_to_json(const MatchingRecord &record)
    {
        json j;
        j["variant"] = variant_tag(record.variant);
        j["matches"] = json::array();
        for (const auto &mp : record.matching.pairs)
            j["matches"].push_back({{"proposer", mp.proposer}, {"receiver", mp.receiver}});
        if (record.objective_value)
            j["objective_value"] = *record.objective_value;
        else
            j["objective_value"] = nullptr;
        return j;
    }

    MatchingRecord matching_from_json(const json &j)
    {
        if (!j.is_object())
            throw InvalidInputError("matching record must be a JSON object.");
        MatchingRecord rec;
        try
        {
            rec.variant = parse_variant(j.at("variant").get<std::string>());
            const auto &matches = j.at("matches");
            if (!matches.is_array())
                throw InvalidInputError("'matches' must be an array.");
            for (const auto &m : matches)
            {
                MatchPair mp{m.at("proposer").get<std::string>(), m.at("receiver").get<std::string>()};
                if (!rec.matching.pairs.insert(mp).second)
                    throw InvalidInputError("duplicate match (" + mp.proposer + ", " + mp.receiver + ")");
            }
            if (j.contains("objective_value") && !j["objective_value"].is_null())
                rec.objective_value = j["objective_value"].get<double>();
        }
        catch (const json::exception &e)
        {
            throw InvalidInputError(std::string("malformed matching record: ") + e.what());
        }
        return rec;
    }

    json blocking_pairs_to_json(const std::set<BlockingPair> &pairs)
    {
        json arr = json::array();
        for (const auto &bp : pairs)
            arr.push_back({{"proposer", bp.proposer}, {"receiver", bp.receiver}});
        return arr;
    }

    json result_to_json(Variant variant, const SolveResult &result)
    {
        json j = matching_to_json(MatchingRecord{variant, result.matching, result.objective_value});
        j["blocking_pairs"] = blocking_pairs_to_json(result.blocking_pairs);
        j["meta"]["engine"] = engine_tag(result.engine);
        j["meta"]["elapsed_ms"] = result.elapsed_ms;
        j["meta"]["stable"] = result.stable();
        return j;
    }

} // namespace blm
