#include "MatchaUtil/Configuration.h"

using namespace Matcha;

// recursive merge of objects, b wins
Matcha::Configuration Matcha::update(Matcha::Configuration& a, Matcha::Configuration& b)
{
    if (a.isNull()) {
        a = b;
        return b;
    }
    if (!a.isObject() || !b.isObject()) {
        return a;
    }

    for (const auto& key : b.getMemberNames()) {
        if (a[key].isObject()) {
            update(a[key], b[key]);
        }
        else {
            a[key] = b[key];
        }
    }
    return a;
}
Matcha::Configuration Matcha::update(Matcha::Configuration& a, const Matcha::Configuration& b)
{
    auto c = b;
    return update(a, c);
}
