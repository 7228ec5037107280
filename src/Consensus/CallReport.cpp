#include "CallReport.hpp"

#include <algorithm>
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <limits>

#include "helper.hpp"

namespace
{

enum class FilterOp { Less, LessEqual, Greater, GreaterEqual, Equal, NotEqual };

template<typename T>
bool compare(const T& a, FilterOp op, const T& b)
{
    switch(op)
    {
        case FilterOp::Less: return a < b;
        case FilterOp::LessEqual: return a <= b;
        case FilterOp::Greater: return a > b;
        case FilterOp::GreaterEqual: return a >= b;
        case FilterOp::Equal: return a == b;
        case FilterOp::NotEqual: return a != b;
    }
    return false;
}

double parse_filter_number(const std::string& value, const std::string& clause)
{
    try
    {
        size_t idx = 0;
        double val = std::stod(value, &idx);
        if(idx != value.size()){throw std::invalid_argument(value);}
        return val;
    }
    catch(const std::exception&)
    {
        throw ConfigError("Invalid number in report filter clause '" + clause + "'");
    }
}

CallReportFilter parse_clause(const std::string& clause)
{
    size_t opPos = clause.find_first_of("<>=!");
    if(opPos == std::string::npos)
    {
        throw ConfigError("Missing operator in report filter clause '" + clause + "'");
    }
    std::string opString = clause.substr(opPos, 1);
    if(opPos + 1 < clause.size() && clause[opPos + 1] == '='){opString += '=';}

    FilterOp op;
    if(opString == "<"){op = FilterOp::Less;}
    else if(opString == "<="){op = FilterOp::LessEqual;}
    else if(opString == ">"){op = FilterOp::Greater;}
    else if(opString == ">="){op = FilterOp::GreaterEqual;}
    else if(opString == "=="){op = FilterOp::Equal;}
    else if(opString == "!="){op = FilterOp::NotEqual;}
    else
    {
        throw ConfigError("Unknown operator '" + opString + "' in report filter clause '" + clause + "'");
    }

    const std::string column = trim(clause.substr(0, opPos));
    std::string value = trim(clause.substr(opPos + opString.size()));
    if(column.empty() || value.empty())
    {
        throw ConfigError("Incomplete report filter clause '" + clause + "'");
    }
    if(value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
    {
        value = value.substr(1, value.size() - 2);
    }

    //text columns
    if(column == "well")
    {
        return [op, value](const CallReportRow& row){ return compare(row.well, op, value); };
    }
    if(column == "candidate")
    {
        return [op, value](const CallReportRow& row){ return compare(row.candidate, op, value); };
    }
    if(column == "from_intersection")
    {
        std::string upper = to_upper(value);
        bool flag;
        if(upper == "TRUE" || upper == "1"){flag = true;}
        else if(upper == "FALSE" || upper == "0"){flag = false;}
        else{throw ConfigError("Invalid boolean in report filter clause '" + clause + "'");}
        return [op, flag](const CallReportRow& row){ return compare(row.fromIntersection, op, flag); };
    }

    //numeric columns
    std::function<double(const CallReportRow&)> getter;
    if(column == "plate"){getter = [](const CallReportRow& row){ return static_cast<double>(row.plate); };}
    else if(column == "pident"){getter = [](const CallReportRow& row){ return row.percentIdentity; };}
    else if(column == "length"){getter = [](const CallReportRow& row){ return static_cast<double>(row.length); };}
    else if(column == "evalue"){getter = [](const CallReportRow& row){ return row.evalue; };}
    else if(column == "bitscore"){getter = [](const CallReportRow& row){ return row.bitscore; };}
    else if(column == "raw_count"){getter = [](const CallReportRow& row){ return static_cast<double>(row.rawCount); };}
    else if(column == "query_count"){getter = [](const CallReportRow& row){ return static_cast<double>(row.queryCount); };}
    else
    {
        throw ConfigError("Unknown column '" + column + "' in report filter clause '" + clause + "'");
    }
    double number = parse_filter_number(value, clause);
    return [getter, op, number](const CallReportRow& row){ return compare(getter(row), op, number); };
}

std::string csv_field(const std::string& field)
{
    if(field.find_first_of(",\"\n") == std::string::npos)
    {
        return field;
    }
    std::string quoted = "\"";
    for(const char c : field)
    {
        if(c == '"'){quoted += "\"\"";}
        else{quoted += c;}
    }
    quoted += "\"";
    return quoted;
}

}

CallReportRow make_report_row(const Well& well, const ConsensusCall& call,
                              unsigned long long rawCount, unsigned long long queryCount)
{
    const HomologyHit& top = call.top();
    CallReportRow row;
    row.plate = well.plate;
    row.well = well.code().substr(1);
    row.candidate = top.subjectAccession;
    row.percentIdentity = top.percentIdentity;
    row.length = top.length;
    row.evalue = top.evalue;
    row.bitscore = top.bitscore;
    row.querySeq = call.querySeq;
    row.queryFile = call.queryFile;
    row.queryName = call.queryName;
    row.rawCount = rawCount;
    row.queryCount = queryCount;
    row.fromIntersection = call.fromIntersection;
    row.otherCandidates = call.other_candidates();
    return row;
}

CallReportFilter parse_report_filter(const std::string& expression)
{
    std::vector<CallReportFilter> clauses;
    if(!trim(expression).empty())
    {
        for(const std::string& clause : splitByDelimiter(expression, "&&"))
        {
            if(trim(clause).empty())
            {
                throw ConfigError("Empty clause in report filter '" + expression + "'");
            }
            clauses.push_back(parse_clause(trim(clause)));
        }
    }

    return [clauses](const CallReportRow& row)
    {
        for(const CallReportFilter& clause : clauses)
        {
            if(!clause(row)){return false;}
        }
        return true;
    };
}

void CallReport::add_call(const Well& well, const std::optional<ConsensusCall>& call,
                          unsigned long long rawCount, unsigned long long queryCount)
{
    if(!call.has_value() || call->hits.empty())
    {
        return;
    }
    rows.push_back(make_report_row(well, call.value(), rawCount, queryCount));
}

void CallReport::add_row(const CallReportRow& row)
{
    rows.push_back(row);
}

void CallReport::sort_rows()
{
    std::stable_sort(rows.begin(), rows.end(), [](const CallReportRow& a, const CallReportRow& b)
    {
        if(a.plate != b.plate){return a.plate < b.plate;}
        return a.well < b.well;
    });
}

void CallReport::filter(const CallReportFilter& predicate)
{
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [&predicate](const CallReportRow& row){ return !predicate(row); }),
               rows.end());
}

void CallReport::write(std::ostream& os)
{
    sort_rows();
    //e-value and bit-score keep every digit blast printed
    const std::streamsize defaultDigits = os.precision();
    const int evalueDigits = std::numeric_limits<double>::digits10;
    os << "plate,well,candidate,percent_identity,length,evalue,bitscore,query_seq,query_file,query_name,"
          "from_intersection,raw_count,query_count,other_candidates\n";
    for(const CallReportRow& row : rows)
    {
        os << row.plate << ',' << csv_field(row.well) << ',' << csv_field(row.candidate) << ','
           << row.percentIdentity << ',' << row.length << ','
           << std::setprecision(evalueDigits) << row.evalue << ',' << row.bitscore << ',' << std::setprecision(defaultDigits)
           << csv_field(row.querySeq) << ',' << csv_field(row.queryFile) << ',' << csv_field(row.queryName) << ','
           << (row.fromIntersection ? "true" : "false") << ',' << row.rawCount << ',' << row.queryCount << ','
           << csv_field(joinStrings(row.otherCandidates, ";")) << '\n';
    }
}

void CallReport::write(const std::string& path)
{
    std::filesystem::path reportPath(path);
    if(reportPath.has_parent_path()){std::filesystem::create_directories(reportPath.parent_path());}

    std::ofstream out(path);
    if(!out)
    {
        throw StageError("Could not open call report for writing: " + path);
    }
    write(out);
    if(!out)
    {
        throw StageError("Writing call report failed: " + path);
    }
}
