#include "BarcodeTable.hpp"

#include <set>
#include <algorithm>
#include <filesystem>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

Well Well::from_code(const std::string& code)
{
    if(code.size() != 4 ||
       !std::isdigit(static_cast<unsigned char>(code[0])) || code[0] == '0' ||
       code[1] < 'A' || code[1] > ('A' + PLATE_ROWS - 1) ||
       !std::isdigit(static_cast<unsigned char>(code[2])) ||
       !std::isdigit(static_cast<unsigned char>(code[3])))
    {
        throw FatalInputError("Invalid well code <" + code + ">, expected e.g. 1A01 (plate 1-9, row A-H, column 01-12)");
    }

    Well well;
    well.plate = code[0] - '0';
    well.row = code[1];
    well.column = std::stoi(code.substr(2, 2));
    if(well.column < 1 || well.column > PLATE_COLUMNS)
    {
        throw FatalInputError("Invalid column in well code <" + code + ">, columns range from 01 to 12");
    }
    return well;
}

std::string Well::code() const
{
    std::string col = std::to_string(column);
    if(col.size() < 2){col = "0" + col;}
    return std::to_string(plate) + row + col;
}

void BarcodeTable::add_well(const Well& well, const std::vector<BarcodePair>& pairs)
{
    if(wellIndex.find(well) != wellIndex.end())
    {
        throw FatalInputError("Duplicate well in barcode descriptor: " + well.code());
    }

    size_t idx = wells.size();
    wells.push_back(well);
    acceptedPairs.push_back(pairs);
    wellIndex.emplace(well, idx);

    for(const BarcodePair& pair : pairs)
    {
        //emplace keeps the first well, later wells are only recorded as overlaps
        auto [it, inserted] = inverseIndex.emplace(pair, idx);
        if(!inserted && it->second != idx)
        {
            overlaps.push_back(BarcodeOverlap{pair, wells.at(it->second), well});
        }
    }
}

bool BarcodeTable::accepts(size_t wellIdx, const BarcodePair& pair) const
{
    const std::vector<BarcodePair>& pairs = acceptedPairs.at(wellIdx);
    return std::find(pairs.begin(), pairs.end(), pair) != pairs.end();
}

std::optional<size_t> BarcodeTable::index_of(const Well& well) const
{
    auto it = wellIndex.find(well);
    if(it == wellIndex.end()){return std::nullopt;}
    return it->second;
}

std::vector<int> BarcodeTable::get_plates() const
{
    std::set<int> plates;
    for(const Well& well : wells){plates.insert(well.plate);}
    return std::vector<int>(plates.begin(), plates.end());
}

BarcodeTable BarcodeTable::load(const std::string& path)
{
    if(!std::filesystem::exists(path))
    {
        throw FatalInputError("Barcode descriptor does not exist: " + path);
    }
    if(!std::filesystem::is_regular_file(path))
    {
        throw FatalInputError("Barcode descriptor is not a regular file: " + path);
    }

    boost::property_tree::ptree root;
    try
    {
        boost::property_tree::read_json(path, root);
    }
    catch(const boost::property_tree::json_parser_error& e)
    {
        throw FatalInputError("Malformed barcode descriptor " + path + ": " + e.what());
    }

    BarcodeTable table;
    //ptree keeps the order of the json object, which is the order wells are matched in
    for(const auto& [wellCode, pairList] : root)
    {
        if(wellCode.empty())
        {
            throw FatalInputError("Barcode descriptor must be a json object of well codes: " + path);
        }
        Well well = Well::from_code(wellCode);
        if(!pairList.data().empty())
        {
            throw FatalInputError("Well " + wellCode + " must map to a list of barcode pairs, found <" + pairList.data() + ">");
        }

        std::vector<BarcodePair> pairs;
        for(const auto& [unusedKey, pairNode] : pairList)
        {
            (void)unusedKey;
            std::vector<std::string> names;
            for(const auto& [nameKey, nameNode] : pairNode)
            {
                (void)nameKey;
                if(!nameNode.empty())
                {
                    throw FatalInputError("Barcode pair of well " + wellCode + " contains a nested element");
                }
                names.push_back(nameNode.get_value<std::string>());
            }
            if(names.size() != 2)
            {
                throw FatalInputError("Barcode pairs must have exactly two names (forward, reverse), well " + wellCode +
                                      " has an entry with " + std::to_string(names.size()));
            }
            pairs.emplace_back(names.at(0), names.at(1));
        }
        table.add_well(well, pairs);
    }

    if(table.size() == 0)
    {
        throw FatalInputError("Barcode descriptor contains no wells: " + path);
    }

    return table;
}
