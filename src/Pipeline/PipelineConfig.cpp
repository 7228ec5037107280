#include "PipelineConfig.hpp"
#include "RunLog.hpp"

#include <fstream>
#include <sstream>
#include <tuple>

namespace parsing {

inline int parse_int(const std::string& v) {
    try {
        size_t idx=0;
        int val = std::stoi(trim(v), &idx);
        if (idx != trim(v).size()) throw std::invalid_argument(v);
        return val;
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer value: '" + v + "'");
    }
}

inline std::vector<std::string> parse_list(const std::string& v)
{
    std::vector<std::string> elements;
    if(trim(v).empty()) return elements;
    for(const std::string& element : splitByDelimiter(v, ","))
    {
        std::string e = trim(element);
        if(e.empty()) throw ConfigError("Empty element in list: '" + v + "'");
        elements.push_back(e);
    }
    return elements;
}

//KEY=value lines of an ini file with their line number
typedef std::tuple<std::string, std::string, int> IniEntry;

inline std::vector<IniEntry> read_ini_entries(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw FatalInputError("Cannot open ini file: " + path);
    }

    std::vector<IniEntry> entries;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line))
    {
        ++lineNo;

        // strip comments
        auto hashPos = line.find('#');
        if (hashPos != std::string::npos) {
            line = line.substr(0, hashPos);
        }

        line = trim(line);
        if (line.empty()) continue;

        // split "key=value" (first '=' only)
        auto eqPos = line.find('=');
        if (eqPos == std::string::npos)
        {
            throw ConfigError("Invalid line (missing '=') at " + std::to_string(lineNo) + " of " + path);
        }
        entries.emplace_back(trim(line.substr(0, eqPos)), trim(line.substr(eqPos+1)), lineNo);
    }
    return entries;
}

//applies all entries, unknown keys are reported and ignored
inline std::vector<std::string> apply_entries(PipelineConfig& cfg, const std::vector<IniEntry>& entries, const std::string& path)
{
    std::vector<std::string> appliedKeys;
    for(const auto& [key, value, lineNo] : entries)
    {
        try
        {
            if(set_config_value(cfg, key, value))
            {
                appliedKeys.push_back(to_upper(key));
            }
            else
            {
                std::cerr << "[PipelineConfig] Warning: unknown key '" << key
                          << "' at line " << lineNo << " of " << path << ", ignoring.\n";
            }
        }
        catch (const std::exception& e)
        {
            throw ConfigError("Error parsing key '" + key + "' at line " + std::to_string(lineNo) + ": " + e.what());
        }
    }
    return appliedKeys;
}

}//namespace

std::string assembler_name(AssemblerEngine engine)
{
    switch(engine)
    {
        case AssemblerEngine::Megahit: return "megahit";
        case AssemblerEngine::Skesa: return "skesa";
        case AssemblerEngine::Spades: return "spades";
    }
    return "unknown";
}

AssemblerEngine parse_assembler(const std::string& value)
{
    std::string v = to_upper(trim(value));
    if(v == "MEGAHIT") return AssemblerEngine::Megahit;
    if(v == "SKESA") return AssemblerEngine::Skesa;
    if(v == "SPADES") return AssemblerEngine::Spades;
    throw ConfigError("Unknown assembler '" + value + "' (use megahit, skesa or spades)");
}

std::string error_policy_name(ErrorPolicy policy)
{
    return policy == ErrorPolicy::Halt ? "halt" : "continue";
}

ErrorPolicy parse_error_policy(const std::string& value)
{
    std::string v = to_upper(trim(value));
    if(v == "CONTINUE") return ErrorPolicy::Continue;
    if(v == "HALT") return ErrorPolicy::Halt;
    throw ConfigError("Unknown error policy '" + value + "' (use continue or halt)");
}

void PipelineConfig::write(std::ostream& os) const
{
    os << "FOLLOWING PARAMETERS ARE SET FOR PLATECALL:\n";

    os << "\tbarcodes="       << barcodes                     << "\n";
    os << "\toutput="         << output                       << "\n";
    os << "\tforward="        << joinStrings(forward, ",")    << "\n";
    os << "\treverse="        << joinStrings(reverse, ",")    << "\n\n";

    if (!tagForward.empty())    os << "\ttagForward="    << tagForward    << "\n";
    if (!tagReverse.empty())    os << "\ttagReverse="    << tagReverse    << "\n";
    if (!primerForward.empty()) os << "\tprimerForward=" << primerForward << "\n";
    if (!primerReverse.empty()) os << "\tprimerReverse=" << primerReverse << "\n";
    os << "\n";

    os << "\tassembler="      << assembler_name(assembler) << "\n";
    os << "\tmegahitParams="  << megahitParams  << "\n";
    os << "\tskesaParams="    << skesaParams    << "\n";
    os << "\tspadesParams="   << spadesParams   << "\n";
    os << "\tfastpParams="    << fastpParams    << "\n";
    os << "\tblastParams="    << blastParams    << "\n\n";

    os << "\tthreads="        << threads                    << "\n";
    os << "\tprefix="         << prefix                     << "\n";
    os << "\tonError="        << error_policy_name(onError) << "\n";
    if (!reportFilter.empty()) os << "\treportFilter=" << reportFilter << "\n";
    os << "\tlogLevel="       << logLevel                   << "\n";
    if (!logFile.empty())      os << "\tlogFile="      << logFile      << "\n";
}

void PipelineConfig::validate() const
{
    // check for necessary parameters
    auto missing = std::vector<std::string>{};
    if (barcodes.empty())      missing.push_back("BARCODES");
    if (output.empty())        missing.push_back("OUTPUT");
    if (forward.empty())       missing.push_back("FORWARD");
    if (reverse.empty())       missing.push_back("REVERSE");
    if (tagForward.empty())    missing.push_back("TAG_FORWARD");
    if (tagReverse.empty())    missing.push_back("TAG_REVERSE");
    if (primerForward.empty()) missing.push_back("PRIMER_FORWARD");
    if (primerReverse.empty()) missing.push_back("PRIMER_REVERSE");

    if (!missing.empty())
    {
        throw ConfigError("Missing required parameter(s): " + joinStrings(missing, ", "));
    }
    if (forward.size() != reverse.size())
    {
        throw ConfigError("FORWARD lists " + std::to_string(forward.size()) + " files but REVERSE lists " +
                          std::to_string(reverse.size()));
    }
    if (threads < 1)
    {
        throw ConfigError("THREADS must be at least 1");
    }
    if (prefix.empty())
    {
        throw ConfigError("PREFIX must not be empty");
    }
}

bool set_config_value(PipelineConfig& cfg, const std::string& key, const std::string& value)
{
    std::string KEY = to_upper(trim(key));

    auto set_required_string = [&](std::string& target)
    {
        if (value.empty()) throw ConfigError("Empty value for a required field");
        target = value;
    };

    // REQUIRED
    if (KEY == "BARCODES")             set_required_string(cfg.barcodes);
    else if (KEY == "OUTPUT")          set_required_string(cfg.output);

    // INPUT
    else if (KEY == "FORWARD")         cfg.forward = parsing::parse_list(value);
    else if (KEY == "REVERSE")         cfg.reverse = parsing::parse_list(value);
    else if (KEY == "TAG_FORWARD")     cfg.tagForward = value;
    else if (KEY == "TAG_REVERSE")     cfg.tagReverse = value;
    else if (KEY == "PRIMER_FORWARD")  cfg.primerForward = value;
    else if (KEY == "PRIMER_REVERSE")  cfg.primerReverse = value;

    // TOOLS
    else if (KEY == "ASSEMBLER")       cfg.assembler = parse_assembler(value);
    else if (KEY == "MEGAHIT_PARAMS")  cfg.megahitParams = value;
    else if (KEY == "SKESA_PARAMS")    cfg.skesaParams = value;
    else if (KEY == "SPADES_PARAMS")   cfg.spadesParams = value;
    else if (KEY == "FASTP_PARAMS")    cfg.fastpParams = value;
    else if (KEY == "BLAST_PARAMS")    cfg.blastParams = value;
    else if (KEY == "CUTADAPT")        set_required_string(cfg.cutadaptExe);
    else if (KEY == "FASTP")           set_required_string(cfg.fastpExe);
    else if (KEY == "MEGAHIT")         set_required_string(cfg.megahitExe);
    else if (KEY == "SKESA")           set_required_string(cfg.skesaExe);
    else if (KEY == "SPADES")          set_required_string(cfg.spadesExe);
    else if (KEY == "BLASTN")          set_required_string(cfg.blastnExe);

    // RUN
    else if (KEY == "THREADS")         cfg.threads = parsing::parse_int(value);
    else if (KEY == "PREFIX")          set_required_string(cfg.prefix);
    else if (KEY == "ON_ERROR")        cfg.onError = parse_error_policy(value);
    else if (KEY == "REPORT_FILTER")   cfg.reportFilter = value;
    else if (KEY == "DATETIME_FORMAT") set_required_string(cfg.datetimeFormat);
    else if (KEY == "LOG_LEVEL")       cfg.logLevel = log_level_name(parse_log_level(value));
    else if (KEY == "LOG_FILE")        cfg.logFile = value;
    else
    {
        return false;
    }
    return true;
}

PipelineConfig load_config_from_file(const std::string& path)
{
    PipelineConfig cfg;
    parsing::apply_entries(cfg, parsing::read_ini_entries(path), path);
    return cfg;
}

std::vector<std::string> apply_override_file(PipelineConfig& cfg, const std::string& path)
{
    std::vector<std::string> appliedKeys = parsing::apply_entries(cfg, parsing::read_ini_entries(path), path);
    cfg.validate();
    return appliedKeys;
}
