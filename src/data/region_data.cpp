#include "idcard/region.h"

namespace idcard {
namespace data {

namespace {

std::vector<RegionEntry> InitRegionData() {
    std::vector<RegionEntry> regions = {
        // Province level
        {"110000", "北京市"},
        {"120000", "天津市"},
        {"130000", "河北省"},
        {"140000", "山西省"},
        {"150000", "内蒙古自治区"},
        {"210000", "辽宁省"},
        {"220000", "吉林省"},
        {"230000", "黑龙江省"},
        {"310000", "上海市"},
        {"320000", "江苏省"},
        {"330000", "浙江省"},
        {"340000", "安徽省"},
        {"350000", "福建省"},
        {"360000", "江西省"},
        {"370000", "山东省"},
        {"410000", "河南省"},
        {"420000", "湖北省"},
        {"430000", "湖南省"},
        {"440000", "广东省"},
        {"450000", "广西壮族自治区"},
        {"460000", "海南省"},
        {"500000", "重庆市"},
        {"510000", "四川省"},
        {"520000", "贵州省"},
        {"530000", "云南省"},
        {"540000", "西藏自治区"},
        {"610000", "陕西省"},
        {"620000", "甘肃省"},
        {"630000", "青海省"},
        {"640000", "宁夏回族自治区"},
        {"650000", "新疆维吾尔自治区"},

        // Beijing
        {"110101", "北京市东城区"},
        {"110102", "北京市西城区"},
        {"110105", "北京市朝阳区"},
        {"110106", "北京市丰台区"},
        {"110107", "北京市石景山区"},
        {"110108", "北京市海淀区"},
        {"110109", "北京市门头沟区"},
        {"110111", "北京市房山区"},
        {"110112", "北京市通州区"},
        {"110113", "北京市顺义区"},
        {"110114", "北京市昌平区"},
        {"110115", "北京市大兴区"},

        // Tianjin
        {"120101", "天津市和平区"},
        {"120102", "天津市河东区"},
        {"120103", "天津市河西区"},
        {"120104", "天津市南开区"},
        {"120105", "天津市河北区"},
        {"120106", "天津市红桥区"},

        // Hebei
        {"130100", "河北省石家庄市"},
        {"130102", "河北省石家庄市长安区"},
        {"130104", "河北省石家庄市桥西区"},
        {"130133", "河北省石家庄市赵县"},
        {"130200", "河北省唐山市"},
        {"130202", "河北省唐山市路南区"},
        {"130203", "河北省唐山市路北区"},
        {"130600", "河北省保定市"},

        // Shanxi
        {"140100", "山西省太原市"},
        {"140105", "山西省太原市小店区"},
        {"140106", "山西省太原市迎泽区"},

        // Inner Mongolia
        {"150100", "内蒙古自治区呼和浩特市"},
        {"150102", "内蒙古自治区呼和浩特市新城区"},
        {"150200", "内蒙古自治区包头市"},

        // Liaoning
        {"210100", "辽宁省沈阳市"},
        {"210102", "辽宁省沈阳市和平区"},
        {"210103", "辽宁省沈阳市沈河区"},
        {"210200", "辽宁省大连市"},
        {"210202", "辽宁省大连市中山区"},
        {"210203", "辽宁省大连市西岗区"},
        {"210211", "辽宁省大连市甘井子区"},

        // Jilin
        {"220100", "吉林省长春市"},
        {"220102", "吉林省长春市南关区"},
        {"220104", "吉林省长春市朝阳区"},

        // Heilongjiang
        {"230100", "黑龙江省哈尔滨市"},
        {"230102", "黑龙江省哈尔滨市道里区"},
        {"230103", "黑龙江省哈尔滨市南岗区"},
        {"230127", "黑龙江省哈尔滨市木兰县"},

        // Shanghai
        {"310101", "上海市黄浦区"},
        {"310104", "上海市徐汇区"},
        {"310105", "上海市长宁区"},
        {"310106", "上海市静安区"},
        {"310107", "上海市普陀区"},
        {"310109", "上海市虹口区"},
        {"310110", "上海市杨浦区"},
        {"310112", "上海市闵行区"},
        {"310113", "上海市宝山区"},
        {"310115", "上海市浦东新区"},

        // Jiangsu
        {"320100", "江苏省南京市"},
        {"320102", "江苏省南京市玄武区"},
        {"320104", "江苏省南京市秦淮区"},
        {"320500", "江苏省苏州市"},
        {"320505", "江苏省苏州市虎丘区"},
        {"320506", "江苏省苏州市吴中区"},

        // Zhejiang
        {"330100", "浙江省杭州市"},
        {"330102", "浙江省杭州市上城区"},
        {"330105", "浙江省杭州市拱墅区"},
        {"330106", "浙江省杭州市西湖区"},
        {"330108", "浙江省杭州市滨江区"},
        {"330109", "浙江省杭州市萧山区"},
        {"330110", "浙江省杭州市余杭区"},
        {"330200", "浙江省宁波市"},
        {"330203", "浙江省宁波市海曙区"},
        {"330400", "浙江省嘉兴市"},
        {"330421", "浙江省嘉兴市嘉善县"},

        // Anhui
        {"340100", "安徽省合肥市"},
        {"340102", "安徽省合肥市瑶海区"},
        {"340103", "安徽省合肥市庐阳区"},

        // Fujian
        {"350100", "福建省福州市"},
        {"350102", "福建省福州市鼓楼区"},
        {"350200", "福建省厦门市"},
        {"350203", "福建省厦门市思明区"},

        // Jiangxi
        {"360100", "江西省南昌市"},
        {"360102", "江西省南昌市东湖区"},

        // Shandong
        {"370100", "山东省济南市"},
        {"370102", "山东省济南市历下区"},
        {"370200", "山东省青岛市"},
        {"370202", "山东省青岛市市南区"},
        {"370203", "山东省青岛市市北区"},

        // Henan
        {"410100", "河南省郑州市"},
        {"410102", "河南省郑州市中原区"},
        {"410105", "河南省郑州市金水区"},

        // Hubei
        {"420100", "湖北省武汉市"},
        {"420102", "湖北省武汉市江岸区"},
        {"420106", "湖北省武汉市武昌区"},

        // Hunan
        {"430100", "湖南省长沙市"},
        {"430102", "湖南省长沙市芙蓉区"},
        {"430104", "湖南省长沙市岳麓区"},

        // Guangdong
        {"440100", "广东省广州市"},
        {"440103", "广东省广州市荔湾区"},
        {"440104", "广东省广州市越秀区"},
        {"440106", "广东省广州市天河区"},
        {"440300", "广东省深圳市"},
        {"440303", "广东省深圳市罗湖区"},
        {"440304", "广东省深圳市福田区"},
        {"440305", "广东省深圳市南山区"},

        // Guangxi
        {"450100", "广西壮族自治区南宁市"},
        {"450102", "广西壮族自治区南宁市兴宁区"},

        // Hainan
        {"460100", "海南省海口市"},
        {"460105", "海南省海口市秀英区"},

        // Chongqing
        {"500101", "重庆市万州区"},
        {"500103", "重庆市渝中区"},
        {"500105", "重庆市江北区"},

        // Sichuan
        {"510100", "四川省成都市"},
        {"510104", "四川省成都市锦江区"},
        {"510105", "四川省成都市青羊区"},
        {"510107", "四川省成都市武侯区"},
        {"511700", "四川省达州市"},
        {"511702", "四川省达州市通川区"},
        {"511703", "四川省达州市达川区"},

        // Guizhou
        {"520100", "贵州省贵阳市"},
        {"520102", "贵州省贵阳市南明区"},

        // Yunnan
        {"530100", "云南省昆明市"},
        {"530102", "云南省昆明市五华区"},

        // Tibet
        {"540100", "西藏自治区拉萨市"},
        {"540102", "西藏自治区拉萨市城关区"},

        // Shaanxi
        {"610100", "陕西省西安市"},
        {"610102", "陕西省西安市新城区"},
        {"610103", "陕西省西安市碑林区"},

        // Gansu
        {"620100", "甘肃省兰州市"},
        {"620102", "甘肃省兰州市城关区"},

        // Qinghai
        {"630100", "青海省西宁市"},
        {"630102", "青海省西宁市城东区"},
        {"632100", "青海省海东地区"},
        {"632123", "青海省海东地区乐都县"},

        // Ningxia
        {"640100", "宁夏回族自治区银川市"},
        {"640104", "宁夏回族自治区银川市兴庆区"},

        // Xinjiang
        {"650100", "新疆维吾尔自治区乌鲁木齐市"},
        {"650102", "新疆维吾尔自治区乌鲁木齐市天山区"},
        {"654300", "新疆维吾尔自治区阿勒泰地区"},
        {"654325", "新疆维吾尔自治区阿勒泰地区青河县"},
    };
    return regions;
}

} // namespace

const std::vector<RegionEntry>& builtinRegions() {
    static const std::vector<RegionEntry> regions = InitRegionData();
    return regions;
}

} // namespace data
} // namespace idcard
