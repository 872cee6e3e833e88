// ============================================================================
//  File: src/g60tool.cpp — CLI G60 (encode / decode / verify / random / info)
//  Project: G60 Text Codec
//
//  COMMANDES
//  ---------
//  g60tool encode  [--in FILE | --text STR] [--out FILE]
//  g60tool decode  [--in FILE | --text STR] [--out FILE] [--as-text]
//  g60tool verify  [--in FILE | --text STR] [--json]
//  g60tool canonicalize [--in FILE | --text STR] [--out FILE]
//  g60tool random  (--bytes N | --length N) [--fast] [--seed S]
//  g60tool info    [--json]
//
//  Options communes : --verbose (traces sur stderr).
//  Sans --in/--text l’entrée est stdin ; sans --out la sortie est stdout.
//  Les fins de ligne (\r, \n) en queue du texte à décoder sont ignorées.
//  random : --bytes <= 1 Gio, --length <= encoded_size(1 Gio), sinon usage.
//
//  CODES DE SORTIE
//  ---------------
//   0 = OK, 1 = échec codec ou I/O (détail sur stderr), 2 = usage.
// ============================================================================

#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <cctype>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>
#include <iostream>

#include "g60_codec.hpp"
#include "g60_random.hpp"

// ---------------------------------------------------------------------- Usage
static void usage()
{
    std::cerr <<
              "g60tool encode  [--in <file>|--text <str>] [--out <file>]\n"
              "g60tool decode  [--in <file>|--text <str>] [--out <file>] [--as-text]\n"
              "g60tool verify  [--in <file>|--text <str>] [--json]\n"
              "g60tool canonicalize [--in <file>|--text <str>] [--out <file>]\n"
              "g60tool random  (--bytes N | --length N) [--fast] [--seed S]\n"
              "g60tool info    [--json]\n"
              "                 [--verbose]\n";
}
static bool eqi(const std::string& a, const char* b)
{
    if(a.size()!=std::strlen(b)) return false;
    for(size_t i=0; i<a.size(); ++i) if(std::tolower((unsigned char)a[i])!=std::tolower((unsigned char)b[i])) return false;
    return true;
}

// ------------------------------------------------------------------ Config
enum class Command : uint8_t { None=0, Encode, Decode, Verify, Canonicalize, Random, Info };

struct ToolConfig
{
    Command     cmd = Command::None;
    std::string in;            // vide = stdin
    std::string out;           // vide = stdout
    std::string text;
    bool        has_text = false;
    bool        as_text  = false;  // decode : exige de l’UTF-8
    bool        json     = false;
    bool        verbose  = false;

    // random
    bool        fast      = false;
    bool        has_seed  = false;
    uint64_t    seed      = 0;
    bool        by_length = false;
    size_t      count     = 0;
    bool        has_count = false;
};

static const size_t kMaxRandomBytes = size_t(1) << 30;

static bool parse_size(const char* s, uint64_t& v)
{
    if(!s || !*s) return false;
    char* end=nullptr; errno=0;
    unsigned long long x = std::strtoull(s, &end, 10);
    if(errno!=0 || *end!='\0' || s[0]=='-') return false;
    v = (uint64_t)x;
    return true;
}

static bool parse_args(int argc, char** argv, ToolConfig& C)
{
    if(argc<2) return false;
    const std::string cmd = argv[1];
    if(eqi(cmd,"encode"))      C.cmd=Command::Encode;
    else if(eqi(cmd,"decode")) C.cmd=Command::Decode;
    else if(eqi(cmd,"verify")) C.cmd=Command::Verify;
    else if(eqi(cmd,"canonicalize")) C.cmd=Command::Canonicalize;
    else if(eqi(cmd,"random")) C.cmd=Command::Random;
    else if(eqi(cmd,"info"))   C.cmd=Command::Info;
    else { std::cerr<<"[g60tool] unknown command: "<<cmd<<"\n"; return false; }

    for(int i=2; i<argc; ++i)
    {
        std::string s=argv[i];
        uint64_t v=0;
        if(s=="--in" && i+1<argc)        C.in=argv[++i];
        else if(s=="--out" && i+1<argc)  C.out=argv[++i];
        else if(s=="--text" && i+1<argc){ C.text=argv[++i]; C.has_text=true; }
        else if(s=="--as-text")          C.as_text=true;
        else if(s=="--json")             C.json=true;
        else if(s=="--verbose")          C.verbose=true;
        else if(s=="--fast")             C.fast=true;
        else if(s=="--seed" && i+1<argc)
        {
            if(!parse_size(argv[++i], v)){ std::cerr<<"[g60tool] bad --seed\n"; return false; }
            C.seed=v; C.has_seed=true;
        }
        else if((s=="--bytes" || s=="--length") && i+1<argc)
        {
            if(!parse_size(argv[++i], v)){ std::cerr<<"[g60tool] bad "<<s<<"\n"; return false; }
            const uint64_t cap = (s=="--length") ? g60::encoded_size(kMaxRandomBytes) : kMaxRandomBytes;
            if(v > cap){ std::cerr<<"[g60tool] "<<s<<" too large (max "<<cap<<")\n"; return false; }
            C.count=(size_t)v; C.has_count=true; C.by_length=(s=="--length");
        }
        else { std::cerr<<"[g60tool] unknown option: "<<s<<"\n"; return false; }
    }
    if(C.has_text && !C.in.empty()){ std::cerr<<"[g60tool] --in and --text are exclusive\n"; return false; }
    if(C.cmd==Command::Random && !C.has_count){ std::cerr<<"[g60tool] random needs --bytes or --length\n"; return false; }
    return true;
}

// ------------------------------------------------------------------ I/O
namespace {

struct File {
    FILE* f=nullptr;
    bool owned=false;
    ~File(){ if(f && owned) std::fclose(f); }
    bool open(const std::string& p, const char* mode){ f=std::fopen(p.c_str(), mode); owned=(f!=nullptr); return f!=nullptr; }
};

bool read_all(const std::string& path, std::vector<uint8_t>& out, std::string* err)
{
    File fp;
    if(path.empty()) fp.f=stdin;
    else if(!fp.open(path, "rb")){ if(err)*err=path+": "+std::strerror(errno); return false; }

    out.clear();
    uint8_t buf[1<<14];
    size_t n=0;
    while((n=std::fread(buf,1,sizeof(buf),fp.f))>0) out.insert(out.end(), buf, buf+n);
    if(std::ferror(fp.f)){ if(err)*err=(path.empty()? std::string("stdin") : path)+": read error"; return false; }
    return true;
}

bool write_all(const std::string& path, const void* data, size_t n, std::string* err)
{
    File fp;
    if(path.empty()) fp.f=stdout;
    else if(!fp.open(path, "wb")){ if(err)*err=path+": "+std::strerror(errno); return false; }

    if(n && std::fwrite(data,1,n,fp.f)!=n){ if(err)*err="write error"; return false; }
    if(std::fflush(fp.f)!=0){ if(err)*err="flush error"; return false; }
    return true;
}

std::string strip_eol(std::string s)
{
    while(!s.empty() && (s.back()=='\n' || s.back()=='\r')) s.pop_back();
    return s;
}

} // namespace

// ------------------------------------------------------------------ Logging
static bool g_verbose=false;

static void log_info(const std::string& msg)
{
    if(g_verbose) std::cerr<<"[g60tool] "<<msg<<"\n";
}
static int fail_codec(const g60::Error& e)
{
    std::cerr<<"[g60tool] "<<e.message()<<"\n";
    return 1;
}
static int fail_io(const std::string& msg)
{
    std::cerr<<"[g60tool] I/O: "<<msg<<"\n";
    return 1;
}

static bool load_input(const ToolConfig& C, std::vector<uint8_t>& data, std::string* err)
{
    if(C.has_text){ data.assign(C.text.begin(), C.text.end()); return true; }
    return read_all(C.in, data, err);
}

// ============================================================================
// Commandes
// ============================================================================

static int cmd_encode(const ToolConfig& C)
{
    std::vector<uint8_t> data; std::string err;
    if(!load_input(C, data, &err)) return fail_io(err);

    std::string enc = g60::encode(data);
    log_info("encoded "+std::to_string(data.size())+" bytes -> "+std::to_string(enc.size())+" symbols");
    enc.push_back('\n');
    if(!write_all(C.out, enc.data(), enc.size(), &err)) return fail_io(err);
    return 0;
}

static int cmd_decode(const ToolConfig& C)
{
    std::vector<uint8_t> data; std::string err;
    if(!load_input(C, data, &err)) return fail_io(err);
    const std::string text = strip_eol(std::string(data.begin(), data.end()));

    g60::Error e;
    if(C.as_text)
    {
        std::string s;
        if(!g60::decode_to_string(text, s, &e)) return fail_codec(e);
        log_info("decoded "+std::to_string(text.size())+" symbols -> "+std::to_string(s.size())+" bytes (UTF-8)");
        if(!write_all(C.out, s.data(), s.size(), &err)) return fail_io(err);
        return 0;
    }

    std::vector<uint8_t> bytes;
    if(!g60::decode(text, bytes, &e)) return fail_codec(e);
    log_info("decoded "+std::to_string(text.size())+" symbols -> "+std::to_string(bytes.size())+" bytes");
    if(!write_all(C.out, bytes.data(), bytes.size(), &err)) return fail_io(err);
    return 0;
}

static int cmd_verify(const ToolConfig& C)
{
    std::vector<uint8_t> data; std::string err;
    if(!load_input(C, data, &err)) return fail_io(err);
    const std::string text = strip_eol(std::string(data.begin(), data.end()));

    g60::Error e;
    const bool ok = g60::verify(text, &e);
    if(C.json)
    {
        std::cout << "{\"valid\":" << (ok? "true":"false")
                  << ",\"symbols\":" << text.size();
        if(ok) std::cout << ",\"bytes\":" << g60::decoded_size(text.size());
        else   std::cout << ",\"error\":\"" << g60::error_name(e.code) << "\",\"index\":" << e.index;
        std::cout << "}\n";
    }
    else
    {
        if(ok) std::cout << "valid (" << text.size() << " symbols, "
                         << g60::decoded_size(text.size()) << " bytes)\n";
        else   std::cout << "invalid: " << e.message() << "\n";
    }
    return ok? 0 : 1;
}

static int cmd_canonicalize(const ToolConfig& C)
{
    std::vector<uint8_t> data; std::string err;
    if(!load_input(C, data, &err)) return fail_io(err);
    const std::string text = strip_eol(std::string(data.begin(), data.end()));

    g60::Error e;
    std::string canon;
    if(!g60::canonicalize(text, canon, &e)) return fail_codec(e);
    if(canon != text) log_info("non-canonical input rewritten");
    canon.push_back('\n');
    if(!write_all(C.out, canon.data(), canon.size(), &err)) return fail_io(err);
    return 0;
}

static int cmd_random(const ToolConfig& C)
{
    std::string s;
    try
    {
        if(C.by_length)
        {
            if(C.fast) s = C.has_seed ? g60::fast_random(C.count, C.seed) : g60::fast_random(C.count);
            else       s = g60::random(C.count);
        }
        else
        {
            if(C.fast) s = C.has_seed ? g60::fast_random_bytes(C.count, C.seed) : g60::fast_random_bytes(C.count);
            else       s = g60::random_bytes(C.count);
        }
    }
    catch(const std::bad_alloc&)
    {
        return fail_io("out of memory for "+std::to_string(C.count)+(C.by_length? " symbols":" bytes"));
    }
    catch(const std::length_error&)
    {
        return fail_io("size "+std::to_string(C.count)+" not representable");
    }
    if(C.has_seed && !C.fast) log_info("--seed ignored without --fast");
    log_info("generated "+std::to_string(s.size())+" symbols");
    s.push_back('\n');
    std::string err;
    if(!write_all(C.out, s.data(), s.size(), &err)) return fail_io(err);
    return 0;
}

static int cmd_info(const ToolConfig& C)
{
    if(C.json)
    {
        std::cout << "{\n  \"version\": \"" << G60_VERSION_STRING << "\",\n"
                  << "  \"alphabet\": \"" << g60::kAlphabet << "\",\n"
                  << "  \"block_bytes\": " << g60::BLOCK_BYTES << ",\n"
                  << "  \"group_symbols\": " << g60::GROUP_SYMBOLS << ",\n"
                  << "  \"partial_lengths\": [";
        for(size_t n=1; n<g60::BLOCK_BYTES; ++n)
            std::cout << (n>1? ",":"") << (int)g60::kSymbolsForBytes[n];
        std::cout << "]\n}\n";
        return 0;
    }
    std::cout << "G60 " << G60_VERSION_STRING << "\n"
              << "  alphabet : " << g60::kAlphabet << "\n"
              << "  block    : " << g60::BLOCK_BYTES << " bytes -> " << g60::GROUP_SYMBOLS << " symbols\n"
              << "  partial  :";
    for(size_t n=1; n<g60::BLOCK_BYTES; ++n)
        std::cout << " " << n << "->" << (int)g60::kSymbolsForBytes[n];
    std::cout << "\n";
    return 0;
}

// ============================================================================
// main
// ============================================================================
int main(int argc, char** argv)
{
    ToolConfig C;
    if(!parse_args(argc, argv, C))
    {
        usage();
        return 2;
    }
    g_verbose = C.verbose;

    switch(C.cmd)
    {
    case Command::Encode: return cmd_encode(C);
    case Command::Decode: return cmd_decode(C);
    case Command::Verify: return cmd_verify(C);
    case Command::Canonicalize: return cmd_canonicalize(C);
    case Command::Random: return cmd_random(C);
    case Command::Info:   return cmd_info(C);
    default: break;
    }
    usage();
    return 2;
}
