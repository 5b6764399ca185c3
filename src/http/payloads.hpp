#pragma once
#include "core/RouteGroups.hpp"
#include "models/CoreTypes.hpp"
#include "models/params.hpp"

// JSON-in / JSON-out bodies of the service endpoints, kept free of the HTTP
// layer. Malformed payloads throw std::runtime_error or a
// nlohmann::json::exception.

// {"segments":[{CORR_ID,CORR_MP,CORR_ENDMP,DEPT_ID}...],
//  "crashes":[{CORRIDOR,REF_POINT}...]}
// -> {"counts":[{"segment_key":..,"count":n}...],"matched":n,"unmatched":n}
Json match_crashes_payload(const Json &body);

// {"merged":FeatureCollection,"candidates":FeatureCollection,"params":{..}}
// -> FeatureCollection of kept candidates plus "removed".
Json dedup_payload(const Json &body, const MatchingParams &defaults);

// FeatureCollection of merged lines -> length-weighted rates by category.
Json rates_payload(const Json &body);

Json summary_to_json(const RateSummary &s);
