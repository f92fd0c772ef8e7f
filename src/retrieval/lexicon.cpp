#include "lexicon.hpp"
#include "../bank_record.hpp"
#include "../util.hpp"
#include <algorithm>
#include <utility>

namespace bankmatch {

namespace {

struct BrandEntry {
    const char* canonical;
    std::vector<const char*> aliases; // lowercase; canonical is implied
};

const std::vector<BrandEntry>& brand_table() {
    static const std::vector<BrandEntry> table = {
        // State-owned
        {"中国工商银行", {"工商银行", "工行", "icbc", "中国工商"}},
        {"中国农业银行", {"农业银行", "农行", "abc", "中国农业"}},
        {"中国银行", {"中行", "boc", "中银"}},
        {"中国建设银行", {"建设银行", "建行", "ccb", "中国建设"}},
        {"交通银行", {"交行", "bocom", "交银"}},
        {"中国邮政储蓄银行", {"邮政储蓄银行", "邮储银行", "邮政银行", "邮储", "psbc"}},
        // Joint-stock
        {"招商银行", {"招行", "cmb", "招银"}},
        {"上海浦东发展银行", {"浦东发展银行", "浦发银行", "浦发", "spdb"}},
        {"中信银行", {"中信", "citic"}},
        {"中国光大银行", {"光大银行", "光大", "ceb"}},
        {"华夏银行", {"华夏", "hxb"}},
        {"中国民生银行", {"民生银行", "民生", "cmbc"}},
        {"广发银行", {"广东发展银行", "广发", "cgb"}},
        {"平安银行", {"平安", "pab"}},
        {"兴业银行", {"兴业", "cib"}},
        {"浙商银行", {"浙商"}},
        {"渤海银行", {"渤海"}},
        {"恒丰银行", {"恒丰"}},
        // City commercial
        {"北京银行", {"bob"}},
        {"上海银行", {"bos"}},
        {"江苏银行", {}},
        {"南京银行", {}},
        {"宁波银行", {}},
        {"杭州银行", {}},
        {"徽商银行", {"徽商"}},
        {"长沙银行", {}},
        {"郑州银行", {}},
        {"青岛银行", {}},
        {"大连银行", {}},
        {"哈尔滨银行", {}},
        {"盛京银行", {"盛京"}},
        // Rural commercial
        {"北京农商银行", {"北京农村商业银行", "北京农商"}},
        {"上海农商银行", {"上海农村商业银行", "上海农商"}},
        {"重庆农商银行", {"重庆农村商业银行", "重庆农商"}},
        {"广州农商银行", {"广州农村商业银行", "广州农商"}},
        {"深圳农商银行", {"深圳农村商业银行", "深圳农商"}},
        // Policy banks
        {"国家开发银行", {"国开行"}},
        {"中国进出口银行", {"进出口银行"}},
        {"中国农业发展银行", {"农业发展银行", "农发行"}},
        // Foreign
        {"汇丰银行", {"汇丰", "hsbc"}},
        {"渣打银行", {"渣打"}},
        {"花旗银行", {"花旗", "citi"}},
        {"东亚银行", {"东亚"}},
    };
    return table;
}

// (alias, canonical), longest alias first so "中国农业银行" wins over "农业银行"
const std::vector<std::pair<std::string, std::string>>& alias_index() {
    static const std::vector<std::pair<std::string, std::string>> index = [] {
        std::vector<std::pair<std::string, std::string>> out;
        for (const auto& b : brand_table()) {
            out.emplace_back(b.canonical, b.canonical);
            for (const char* a : b.aliases) out.emplace_back(a, b.canonical);
        }
        std::stable_sort(out.begin(), out.end(), [](const auto& x, const auto& y) {
            return utf8_length(x.first) > utf8_length(y.first);
        });
        return out;
    }();
    return index;
}

std::vector<std::string> by_length_desc(std::vector<std::string> terms) {
    std::stable_sort(terms.begin(), terms.end(), [](const std::string& a, const std::string& b) {
        return utf8_length(a) > utf8_length(b);
    });
    return terms;
}

const std::vector<std::string>& cities() {
    static const std::vector<std::string> list = by_length_desc({
        "北京", "上海", "天津", "重庆", "广州", "深圳", "杭州", "南京", "苏州", "武汉",
        "成都", "西安", "郑州", "长沙", "沈阳", "大连", "青岛", "济南", "厦门", "福州",
        "宁波", "无锡", "合肥", "南昌", "昆明", "贵阳", "南宁", "海口", "太原", "石家庄",
        "哈尔滨", "长春", "兰州", "西宁", "银川", "乌鲁木齐", "拉萨", "呼和浩特", "珠海",
        "东莞", "佛山", "温州", "常州", "烟台", "唐山", "徐州", "泉州", "绍兴", "嘉兴",
    });
    return list;
}

const std::vector<std::string>& areas() {
    static const std::vector<std::string> list = by_length_desc({
        // Beijing
        "西单", "王府井", "中关村", "国贸", "金融街", "望京", "三里屯", "朝阳门", "建国门",
        "复兴门", "西直门", "东直门", "安定门", "崇文门", "宣武门", "阜成门", "德胜门",
        "前门", "亚运村", "海淀", "朝阳", "东城", "西城", "丰台", "石景山", "通州", "顺义",
        "昌平", "大兴",
        // Shanghai
        "陆家嘴", "外滩", "南京路", "淮海路", "徐家汇", "人民广场", "静安寺", "虹桥", "浦东",
        "黄浦", "长宁", "普陀", "虹口", "杨浦", "闵行", "宝山", "嘉定", "松江", "青浦",
        // Guangzhou
        "天河", "越秀", "荔湾", "海珠", "白云", "番禺", "花都", "南沙", "珠江新城",
        "体育中心", "五羊新城",
        // Shenzhen
        "福田", "罗湖", "南山", "宝安", "龙岗", "盐田", "龙华", "华强北", "科技园", "蛇口",
        "前海",
    });
    return list;
}

// Markers, company suffixes and query filler removed from the residual
const std::vector<std::string>& strip_terms() {
    static const std::vector<std::string> list = by_length_desc({
        "股份有限公司", "有限责任公司", "有限公司", "股份",
        "银行", "信用社", "农村商业", "农商行",
        "请问", "查询", "一下", "什么", "多少", "哪里", "哪个", "哪家", "怎么样", "怎么",
        "联行号", "行号", "号码", "代码", "清算", "地址", "电话",
        "的", "是", "在", "有", "吗", "呢",
    });
    return list;
}

bool is_ascii_alnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

// Position of term in seg; ASCII terms must not touch other ASCII letters
// or digits ("abc" must not fire inside "abcd").
size_t find_term(const std::string& seg, const std::string& term, size_t from = 0) {
    bool ascii = !term.empty() && static_cast<unsigned char>(term[0]) < 0x80;
    size_t pos = seg.find(term, from);
    while (pos != std::string::npos && ascii) {
        bool left_ok = pos == 0 || !is_ascii_alnum(seg[pos - 1]);
        size_t end = pos + term.size();
        bool right_ok = end >= seg.size() || !is_ascii_alnum(seg[end]);
        if (left_ok && right_ok) break;
        pos = seg.find(term, pos + 1);
    }
    return pos;
}

// Remove every occurrence of term, splitting the segment at each hole.
bool cut_term(std::vector<std::string>& segs, const std::string& term) {
    bool found = false;
    std::vector<std::string> out;
    out.reserve(segs.size() + 1);
    for (auto& seg : segs) {
        size_t start = 0;
        size_t pos;
        while ((pos = find_term(seg, term, start)) != std::string::npos) {
            found = true;
            if (pos > start) out.push_back(seg.substr(start, pos - start));
            start = pos + term.size();
        }
        if (start < seg.size()) out.push_back(seg.substr(start));
    }
    segs = std::move(out);
    return found;
}

std::optional<std::string> take_code(std::vector<std::string>& segs) {
    for (const auto& seg : segs) {
        size_t i = 0;
        while (i < seg.size()) {
            if (seg[i] < '0' || seg[i] > '9') { ++i; continue; }
            size_t j = i;
            while (j < seg.size() && seg[j] >= '0' && seg[j] <= '9') ++j;
            if (j - i == kCodeLength) {
                std::string code = seg.substr(i, kCodeLength);
                cut_term(segs, code);
                return code;
            }
            i = j;
        }
    }
    return std::nullopt;
}

} // namespace

const std::vector<std::string>& branch_markers() {
    static const std::vector<std::string> list = by_length_desc({
        "营业部", "营业厅", "分理处", "储蓄所", "支行", "分行", "网点", "分社",
    });
    return list;
}

std::vector<std::string> brand_aliases(const std::string& canonical) {
    for (const auto& b : brand_table()) {
        if (canonical != b.canonical) continue;
        std::vector<std::string> out = {b.canonical};
        for (const char* a : b.aliases) out.emplace_back(a);
        return out;
    }
    return {};
}

TextAnalysis analyze_text(const std::string& text) {
    TextAnalysis a;
    a.segments = normalized_segments(text);
    std::vector<std::string> work = a.segments;

    a.code = take_code(work);

    for (const auto& [alias, canonical] : alias_index()) {
        bool hit = std::any_of(work.begin(), work.end(), [&](const std::string& s) {
            return find_term(s, alias) != std::string::npos;
        });
        if (!hit) continue;
        a.brand = BrandMatch{canonical, alias};
        cut_term(work, alias);
        break;
    }

    for (const auto& city : cities()) {
        if (cut_term(work, city + "市") || cut_term(work, city)) {
            a.city = city;
            break;
        }
    }

    // Areas in order of first appearance in the text
    std::vector<std::pair<size_t, std::string>> found;
    std::string joined;
    for (const auto& s : work) joined += s + " ";
    for (const auto& area : areas()) {
        size_t pos = joined.find(area);
        if (pos == std::string::npos) continue;
        bool nested = std::any_of(found.begin(), found.end(), [&](const auto& f) {
            return f.second.find(area) != std::string::npos;
        });
        if (!nested) found.emplace_back(pos, area);
    }
    std::sort(found.begin(), found.end());
    for (const auto& f : found) {
        a.areas.push_back(f.second);
        cut_term(work, f.second);
    }

    for (const auto& m : branch_markers()) {
        if (cut_term(work, m)) a.markers.push_back(m);
    }
    for (const auto& t : strip_terms()) {
        cut_term(work, t);
    }

    for (auto& s : work) {
        if (utf8_length(s) >= 2) a.residual.push_back(std::move(s));
    }
    return a;
}

bool looks_like_full_name(const std::string& normalized) {
    if (utf8_length(normalized) < 6) return false;

    bool ends_with_marker = false;
    for (const auto& m : branch_markers()) {
        if (normalized.size() >= m.size() &&
            normalized.compare(normalized.size() - m.size(), m.size(), m) == 0) {
            ends_with_marker = true;
            break;
        }
    }
    if (!ends_with_marker) return false;

    static const std::vector<std::string> institutions = {
        "银行", "信用社", "信用合作", "有限公司", "农商行",
    };
    for (const auto& inst : institutions) {
        if (normalized.find(inst) != std::string::npos) return true;
    }
    return false;
}

std::vector<std::string> record_keywords(const std::string& bank_name) {
    TextAnalysis a = analyze_text(bank_name);
    std::vector<std::string> out;
    auto add = [&out](const std::string& k) {
        if (!k.empty() && std::find(out.begin(), out.end(), k) == out.end())
            out.push_back(k);
    };
    if (a.brand) {
        for (const auto& alias : brand_aliases(a.brand->canonical)) add(alias);
        add(a.brand->matched);
    }
    if (a.city) add(*a.city);
    for (const auto& area : a.areas) add(area);
    for (const auto& m : a.markers) add(m);
    return out;
}

} // namespace bankmatch
