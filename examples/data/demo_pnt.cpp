// demo_pnt.cpp created on 2026-10-18 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

// Writes a small config document, reads it back and dumps it.
// When a file name is given, dumps that file instead.

#include <pnt/data/Document.h>
#include <pnt/data/Dumper.h>
#include <pnt/core/log.h>

#include <chrono>
#include <iostream>

using namespace pnt::data;
using namespace pnt::core;


static void dump_document(const Document& doc)
{
    Dumper dumper(std::cout);
    dumper.dump(doc.header);
    for (const auto& value : doc.values)
        dumper.dump(value);
    if (!doc.index.empty())
        std::cout << "index: " << doc.index.size() << " bytes" << std::endl;
}


int main(int argc, const char* argv[])
{
    Logger::init(Logger::Level::Debug);

    try {
        if (argc > 1) {
            dump_document(load_document(argv[1]));
            return 0;
        }

        Document doc;
        doc.values.emplace_back(Object{
            {"name", "svc"},
            {"port", uint16_t(8080)},
            {"enabled", true},
            {"timeout", Duration(std::chrono::seconds(30))},
            {"created", std::chrono::time_point_cast<Ticks>(std::chrono::system_clock::now())},
            {"price", Decimal::from_int(1999, 2)},
        });
        doc.values.emplace_back(Array{"first", "second"});

        const auto data = encode_document(doc, {.footer = true});
        log::info("Encoded {} values into {} bytes", doc.values.size(), data.size());

        dump_document(decode_document(data));
    } catch (const CodecError& e) {
        log::error("{}", e.what());
        return 1;
    }
    return 0;
}
