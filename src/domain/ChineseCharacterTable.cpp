/**
 * @file ChineseCharacterTable.cpp
 * @brief Traditional to Simplified Chinese character pairs, sorted by code point.
 *
 * One-to-one character mappings only. No simplified form in this table is
 * itself a traditional key, so applying the table twice changes nothing.
 */
#include "domain/ChineseCharacterTable.hpp"

namespace whisperim::domain {

const std::vector<CharacterPair>& TraditionalToSimplifiedPairs() {
    static const std::vector<CharacterPair> pairs = {
        {"並", "并"}, {"亂", "乱"}, {"亞", "亚"}, {"佔", "占"}, {"來", "来"}, {"侖", "仑"}, {"侶", "侣"}, {"俁", "俣"},
        {"係", "系"}, {"俠", "侠"}, {"倆", "俩"}, {"倉", "仓"}, {"個", "个"}, {"們", "们"}, {"倖", "幸"}, {"倫", "伦"},
        {"偉", "伟"}, {"側", "侧"}, {"偵", "侦"}, {"偽", "伪"}, {"傑", "杰"}, {"傘", "伞"}, {"備", "备"}, {"傢", "家"},
        {"傭", "佣"}, {"傳", "传"}, {"債", "债"}, {"傷", "伤"}, {"傾", "倾"}, {"僂", "偻"}, {"僅", "仅"}, {"僉", "佥"},
        {"僑", "侨"}, {"僕", "仆"}, {"僥", "侥"}, {"僨", "偾"}, {"僱", "雇"}, {"價", "价"}, {"儀", "仪"}, {"儂", "侬"},
        {"億", "亿"}, {"儈", "侩"}, {"儉", "俭"}, {"儔", "俦"}, {"儕", "侪"}, {"儘", "尽"}, {"償", "偿"}, {"優", "优"},
        {"儲", "储"}, {"儷", "俪"}, {"儼", "俨"}, {"兇", "凶"}, {"兌", "兑"}, {"兒", "儿"}, {"內", "内"}, {"兩", "两"},
        {"冊", "册"}, {"冪", "幂"}, {"凍", "冻"}, {"凜", "凛"}, {"凱", "凯"}, {"別", "别"}, {"刪", "删"}, {"則", "则"},
        {"剋", "克"}, {"剎", "刹"}, {"剗", "刬"}, {"剛", "刚"}, {"剝", "剥"}, {"剮", "剐"}, {"創", "创"}, {"劃", "划"},
        {"劇", "剧"}, {"劉", "刘"}, {"劌", "刿"}, {"劍", "剑"}, {"劑", "剂"}, {"勁", "劲"}, {"動", "动"}, {"務", "务"},
        {"勛", "勋"}, {"勝", "胜"}, {"勞", "劳"}, {"勢", "势"}, {"勱", "劢"}, {"勵", "励"}, {"勸", "劝"}, {"匯", "汇"},
        {"匱", "匮"}, {"區", "区"}, {"協", "协"}, {"卻", "却"}, {"厙", "厍"}, {"厭", "厌"}, {"厲", "厉"}, {"參", "参"},
        {"吳", "吴"}, {"呂", "吕"}, {"咼", "呙"}, {"員", "员"}, {"唄", "呗"}, {"問", "问"}, {"啞", "哑"}, {"啟", "启"},
        {"喚", "唤"}, {"喪", "丧"}, {"喫", "吃"}, {"喬", "乔"}, {"單", "单"}, {"喲", "哟"}, {"嗆", "呛"}, {"嗇", "啬"},
        {"嗎", "吗"}, {"嗚", "呜"}, {"嗩", "唢"}, {"嗶", "哔"}, {"嘆", "叹"}, {"嘍", "喽"}, {"嘔", "呕"}, {"嘖", "啧"},
        {"嘗", "尝"}, {"嘜", "唛"}, {"嘩", "哗"}, {"嘯", "啸"}, {"嘰", "叽"}, {"嘵", "哓"}, {"嘸", "呒"}, {"嘽", "啴"},
        {"噁", "恶"}, {"噓", "嘘"}, {"噝", "咝"}, {"噠", "哒"}, {"噥", "哝"}, {"噦", "哕"}, {"噯", "嗳"}, {"噲", "哙"},
        {"噴", "喷"}, {"噸", "吨"}, {"嚀", "咛"}, {"嚇", "吓"}, {"嚌", "哜"}, {"嚕", "噜"}, {"嚥", "咽"}, {"嚦", "呖"},
        {"嚨", "咙"}, {"嚮", "向"}, {"嚳", "喾"}, {"嚴", "严"}, {"嚶", "嘤"}, {"囀", "啭"}, {"囁", "嗫"}, {"囈", "呓"},
        {"囉", "啰"}, {"囑", "嘱"}, {"囘", "回"}, {"囪", "囱"}, {"圇", "囵"}, {"國", "国"}, {"圍", "围"}, {"園", "园"},
        {"圓", "圆"}, {"圖", "图"}, {"團", "团"}, {"埡", "垭"}, {"執", "执"}, {"堅", "坚"}, {"堊", "垩"}, {"堝", "埚"},
        {"堯", "尧"}, {"報", "报"}, {"場", "场"}, {"塊", "块"}, {"塏", "垲"}, {"塒", "埘"}, {"塢", "坞"}, {"塵", "尘"},
        {"塹", "堑"}, {"墊", "垫"}, {"墜", "坠"}, {"墮", "堕"}, {"墳", "坟"}, {"墾", "垦"}, {"壇", "坛"}, {"壎", "埙"},
        {"壓", "压"}, {"壘", "垒"}, {"壙", "圹"}, {"壚", "垆"}, {"壞", "坏"}, {"壟", "垄"}, {"壢", "坜"}, {"壩", "坝"},
        {"壪", "塆"}, {"壯", "壮"}, {"壺", "壶"}, {"壽", "寿"}, {"夠", "够"}, {"夢", "梦"}, {"夥", "伙"}, {"夾", "夹"},
        {"奐", "奂"}, {"奧", "奥"}, {"奩", "奁"}, {"奪", "夺"}, {"奮", "奋"}, {"妝", "妆"}, {"妳", "你"}, {"姍", "姗"},
        {"姦", "奸"}, {"姪", "侄"}, {"娛", "娱"}, {"婁", "娄"}, {"婦", "妇"}, {"婭", "娅"}, {"媧", "娲"}, {"媯", "妫"},
        {"媼", "媪"}, {"媽", "妈"}, {"嫗", "妪"}, {"嫵", "妩"}, {"嫻", "娴"}, {"嫿", "婳"}, {"嬈", "娆"}, {"嬋", "婵"},
        {"嬌", "娇"}, {"嬙", "嫱"}, {"嬡", "嫒"}, {"嬤", "嬷"}, {"嬪", "嫔"}, {"嬰", "婴"}, {"嬸", "婶"}, {"孌", "娈"},
        {"孫", "孙"}, {"學", "学"}, {"孿", "孪"}, {"宮", "宫"}, {"寢", "寝"}, {"實", "实"}, {"寧", "宁"}, {"審", "审"},
        {"寫", "写"}, {"寬", "宽"}, {"寵", "宠"}, {"寶", "宝"}, {"將", "将"}, {"專", "专"}, {"尋", "寻"}, {"對", "对"},
        {"導", "导"}, {"尷", "尴"}, {"屆", "届"}, {"屍", "尸"}, {"屜", "屉"}, {"屢", "屡"}, {"層", "层"}, {"屨", "屦"},
        {"屬", "属"}, {"岡", "冈"}, {"峴", "岘"}, {"島", "岛"}, {"峽", "峡"}, {"崍", "崃"}, {"崗", "岗"}, {"崢", "峥"},
        {"崬", "岽"}, {"嵐", "岚"}, {"嶁", "嵝"}, {"嶇", "岖"}, {"嶔", "嵚"}, {"嶗", "崂"}, {"嶠", "峤"}, {"嶢", "峣"},
        {"嶧", "峄"}, {"嶨", "峃"}, {"嶮", "崄"}, {"嶸", "嵘"}, {"嶺", "岭"}, {"嶼", "屿"}, {"嶽", "岳"}, {"巋", "岿"},
        {"巒", "峦"}, {"巔", "巅"}, {"巰", "巯"}, {"帥", "帅"}, {"師", "师"}, {"帳", "帐"}, {"帶", "带"}, {"幀", "帧"},
        {"幃", "帏"}, {"幗", "帼"}, {"幘", "帻"}, {"幟", "帜"}, {"幣", "币"}, {"幫", "帮"}, {"幬", "帱"}, {"幹", "干"},
        {"幾", "几"}, {"庫", "库"}, {"廁", "厕"}, {"廂", "厢"}, {"廄", "厩"}, {"廈", "厦"}, {"廎", "庼"}, {"廚", "厨"},
        {"廝", "厮"}, {"廟", "庙"}, {"廠", "厂"}, {"廡", "庑"}, {"廢", "废"}, {"廣", "广"}, {"廩", "廪"}, {"廬", "庐"},
        {"廳", "厅"}, {"張", "张"}, {"強", "强"}, {"彈", "弹"}, {"彌", "弥"}, {"彎", "弯"}, {"彙", "汇"}, {"彠", "彟"},
        {"彥", "彦"}, {"後", "后"}, {"徑", "径"}, {"從", "从"}, {"徠", "徕"}, {"復", "复"}, {"徵", "征"}, {"徹", "彻"},
        {"恥", "耻"}, {"悅", "悦"}, {"悵", "怅"}, {"悶", "闷"}, {"惡", "恶"}, {"惱", "恼"}, {"惲", "恽"}, {"惻", "恻"},
        {"愛", "爱"}, {"愜", "惬"}, {"愴", "怆"}, {"愷", "恺"}, {"愾", "忾"}, {"態", "态"}, {"慍", "愠"}, {"慘", "惨"},
        {"慚", "惭"}, {"慟", "恸"}, {"慣", "惯"}, {"慪", "怄"}, {"慫", "怂"}, {"慮", "虑"}, {"慳", "悭"}, {"慶", "庆"},
        {"慾", "欲"}, {"憂", "忧"}, {"憊", "惫"}, {"憐", "怜"}, {"憑", "凭"}, {"憒", "愦"}, {"憚", "惮"}, {"憤", "愤"},
        {"憫", "悯"}, {"憮", "怃"}, {"憲", "宪"}, {"憶", "忆"}, {"懇", "恳"}, {"應", "应"}, {"懌", "怿"}, {"懞", "蒙"},
        {"懟", "怼"}, {"懣", "懑"}, {"懨", "恹"}, {"懲", "惩"}, {"懶", "懒"}, {"懷", "怀"}, {"懸", "悬"}, {"懺", "忏"},
        {"懼", "惧"}, {"懾", "慑"}, {"戀", "恋"}, {"戇", "戆"}, {"戔", "戋"}, {"戧", "戗"}, {"戩", "戬"}, {"戰", "战"},
        {"戲", "戏"}, {"戶", "户"}, {"拋", "抛"}, {"挾", "挟"}, {"捫", "扪"}, {"掃", "扫"}, {"掄", "抡"}, {"掗", "挜"},
        {"掙", "挣"}, {"掛", "挂"}, {"採", "采"}, {"揀", "拣"}, {"揚", "扬"}, {"換", "换"}, {"揮", "挥"}, {"損", "损"},
        {"搖", "摇"}, {"搗", "捣"}, {"搵", "揾"}, {"搶", "抢"}, {"摑", "掴"}, {"摜", "掼"}, {"摟", "搂"}, {"摯", "挚"},
        {"摳", "抠"}, {"摶", "抟"}, {"摻", "掺"}, {"撈", "捞"}, {"撏", "挦"}, {"撐", "撑"}, {"撓", "挠"}, {"撟", "挢"},
        {"撣", "掸"}, {"撥", "拨"}, {"撫", "抚"}, {"撲", "扑"}, {"撳", "揿"}, {"撻", "挞"}, {"撾", "挝"}, {"撿", "捡"},
        {"擁", "拥"}, {"擄", "掳"}, {"擇", "择"}, {"擊", "击"}, {"擋", "挡"}, {"擔", "担"}, {"據", "据"}, {"擠", "挤"},
        {"擡", "抬"}, {"擬", "拟"}, {"擯", "摈"}, {"擰", "拧"}, {"擱", "搁"}, {"擲", "掷"}, {"擴", "扩"}, {"擷", "撷"},
        {"擺", "摆"}, {"擻", "擞"}, {"擼", "撸"}, {"擾", "扰"}, {"攄", "摅"}, {"攆", "撵"}, {"攏", "拢"}, {"攔", "拦"},
        {"攖", "撄"}, {"攙", "搀"}, {"攛", "撺"}, {"攜", "携"}, {"攝", "摄"}, {"攢", "攒"}, {"攣", "挛"}, {"攤", "摊"},
        {"攪", "搅"}, {"攬", "揽"}, {"敗", "败"}, {"敘", "叙"}, {"敵", "敌"}, {"數", "数"}, {"斂", "敛"}, {"斃", "毙"},
        {"斕", "斓"}, {"斬", "斩"}, {"斷", "断"}, {"於", "于"}, {"時", "时"}, {"晉", "晋"}, {"晝", "昼"}, {"暈", "晕"},
        {"暉", "晖"}, {"暘", "旸"}, {"暢", "畅"}, {"暫", "暂"}, {"曄", "晔"}, {"曆", "历"}, {"曇", "昙"}, {"曉", "晓"},
        {"曖", "暧"}, {"曠", "旷"}, {"曬", "晒"}, {"書", "书"}, {"會", "会"}, {"朧", "胧"}, {"東", "东"}, {"柵", "栅"},
        {"梔", "栀"}, {"梘", "枧"}, {"條", "条"}, {"梟", "枭"}, {"棄", "弃"}, {"棖", "枨"}, {"棗", "枣"}, {"棟", "栋"},
        {"棧", "栈"}, {"棲", "栖"}, {"椏", "桠"}, {"楊", "杨"}, {"楓", "枫"}, {"楨", "桢"}, {"業", "业"}, {"極", "极"},
        {"榪", "杩"}, {"榮", "荣"}, {"榿", "桤"}, {"構", "构"}, {"槍", "枪"}, {"槧", "椠"}, {"槨", "椁"}, {"槳", "桨"},
        {"槶", "椢"}, {"樁", "桩"}, {"樂", "乐"}, {"樅", "枞"}, {"樓", "楼"}, {"標", "标"}, {"樞", "枢"}, {"樣", "样"},
        {"樸", "朴"}, {"樹", "树"}, {"樺", "桦"}, {"橈", "桡"}, {"橋", "桥"}, {"機", "机"}, {"橢", "椭"}, {"橫", "横"},
        {"檁", "檩"}, {"檉", "柽"}, {"檔", "档"}, {"檜", "桧"}, {"檟", "槚"}, {"檢", "检"}, {"檣", "樯"}, {"檯", "台"},
        {"檳", "槟"}, {"檸", "柠"}, {"檻", "槛"}, {"櫃", "柜"}, {"櫓", "橹"}, {"櫚", "榈"}, {"櫛", "栉"}, {"櫝", "椟"},
        {"櫞", "橼"}, {"櫟", "栎"}, {"櫥", "橱"}, {"櫧", "槠"}, {"櫨", "栌"}, {"櫪", "枥"}, {"櫫", "橥"}, {"櫬", "榇"},
        {"櫳", "栊"}, {"櫸", "榉"}, {"櫻", "樱"}, {"欄", "栏"}, {"權", "权"}, {"欏", "椤"}, {"欒", "栾"}, {"欖", "榄"},
        {"欞", "棂"}, {"歐", "欧"}, {"歡", "欢"}, {"歲", "岁"}, {"歷", "历"}, {"歸", "归"}, {"歿", "殁"}, {"殘", "残"},
        {"殞", "殒"}, {"殤", "殇"}, {"殫", "殚"}, {"殮", "殓"}, {"殯", "殡"}, {"殲", "歼"}, {"殺", "杀"}, {"殼", "壳"},
        {"毀", "毁"}, {"毆", "殴"}, {"毿", "毵"}, {"氈", "毡"}, {"氌", "氇"}, {"氣", "气"}, {"氫", "氢"}, {"氬", "氩"},
        {"氳", "氲"}, {"氾", "泛"}, {"汙", "污"}, {"決", "决"}, {"沒", "没"}, {"沖", "冲"}, {"況", "况"}, {"洩", "泄"},
        {"浹", "浃"}, {"涇", "泾"}, {"涼", "凉"}, {"淒", "凄"}, {"淚", "泪"}, {"淨", "净"}, {"淪", "沦"}, {"淵", "渊"},
        {"淶", "涞"}, {"淺", "浅"}, {"渙", "涣"}, {"減", "减"}, {"渦", "涡"}, {"測", "测"}, {"渾", "浑"}, {"湊", "凑"},
        {"湞", "浈"}, {"湯", "汤"}, {"準", "准"}, {"溝", "沟"}, {"溫", "温"}, {"滄", "沧"}, {"滅", "灭"}, {"滌", "涤"},
        {"滎", "荥"}, {"滬", "沪"}, {"滯", "滞"}, {"滲", "渗"}, {"滸", "浒"}, {"滾", "滚"}, {"滿", "满"}, {"漁", "渔"},
        {"漚", "沤"}, {"漢", "汉"}, {"漣", "涟"}, {"漬", "渍"}, {"漲", "涨"}, {"漵", "溆"}, {"漸", "渐"}, {"漿", "浆"},
        {"潑", "泼"}, {"潔", "洁"}, {"潙", "沩"}, {"潛", "潜"}, {"潤", "润"}, {"潯", "浔"}, {"潰", "溃"}, {"潷", "滗"},
        {"潿", "涠"}, {"澀", "涩"}, {"澆", "浇"}, {"澇", "涝"}, {"澗", "涧"}, {"澠", "渑"}, {"澤", "泽"}, {"澦", "滪"},
        {"澩", "泶"}, {"澮", "浍"}, {"澱", "淀"}, {"濁", "浊"}, {"濃", "浓"}, {"濕", "湿"}, {"濘", "泞"}, {"濛", "蒙"},
        {"濟", "济"}, {"濤", "涛"}, {"濫", "滥"}, {"濰", "潍"}, {"濱", "滨"}, {"濺", "溅"}, {"濼", "泺"}, {"濾", "滤"},
        {"瀅", "滢"}, {"瀆", "渎"}, {"瀉", "泻"}, {"瀋", "沈"}, {"瀏", "浏"}, {"瀕", "濒"}, {"瀘", "泸"}, {"瀝", "沥"},
        {"瀟", "潇"}, {"瀠", "潆"}, {"瀧", "泷"}, {"瀨", "濑"}, {"瀰", "弥"}, {"瀲", "潋"}, {"灃", "沣"}, {"灄", "滠"},
        {"灑", "洒"}, {"灕", "漓"}, {"灘", "滩"}, {"灝", "灏"}, {"灣", "湾"}, {"灤", "滦"}, {"灩", "滟"}, {"災", "灾"},
        {"為", "为"}, {"烏", "乌"}, {"烴", "烃"}, {"無", "无"}, {"煉", "炼"}, {"煒", "炜"}, {"煙", "烟"}, {"煥", "焕"},
        {"煩", "烦"}, {"煬", "炀"}, {"熒", "荧"}, {"熗", "炝"}, {"熱", "热"}, {"熾", "炽"}, {"燁", "烨"}, {"燈", "灯"},
        {"燉", "炖"}, {"燒", "烧"}, {"燙", "烫"}, {"燜", "焖"}, {"營", "营"}, {"燦", "灿"}, {"燭", "烛"}, {"燴", "烩"},
        {"燼", "烬"}, {"燾", "焘"}, {"爍", "烁"}, {"爐", "炉"}, {"爛", "烂"}, {"爭", "争"}, {"爲", "为"}, {"爺", "爷"},
        {"爾", "尔"}, {"牀", "床"}, {"牆", "墙"}, {"牘", "牍"}, {"牠", "它"}, {"牽", "牵"}, {"犖", "荦"}, {"犛", "牦"},
        {"犢", "犊"}, {"犧", "牺"}, {"狀", "状"}, {"狹", "狭"}, {"狽", "狈"}, {"猙", "狰"}, {"猶", "犹"}, {"猻", "狲"},
        {"獃", "呆"}, {"獄", "狱"}, {"獅", "狮"}, {"獎", "奖"}, {"獨", "独"}, {"獪", "狯"}, {"獫", "猃"}, {"獰", "狞"},
        {"獲", "获"}, {"獵", "猎"}, {"獷", "犷"}, {"獸", "兽"}, {"獺", "獭"}, {"獻", "献"}, {"獼", "猕"}, {"玀", "猡"},
        {"現", "现"}, {"琺", "珐"}, {"琿", "珲"}, {"瑋", "玮"}, {"瑣", "琐"}, {"瑤", "瑶"}, {"瑪", "玛"}, {"璉", "琏"},
        {"璣", "玑"}, {"璫", "珰"}, {"環", "环"}, {"璽", "玺"}, {"瓊", "琼"}, {"瓏", "珑"}, {"瓔", "璎"}, {"甌", "瓯"},
        {"甕", "瓮"}, {"產", "产"}, {"畝", "亩"}, {"畢", "毕"}, {"畫", "画"}, {"異", "异"}, {"畵", "画"}, {"當", "当"},
        {"疇", "畴"}, {"疊", "叠"}, {"痙", "痉"}, {"痾", "疴"}, {"瘂", "痖"}, {"瘋", "疯"}, {"瘍", "疡"}, {"瘓", "痪"},
        {"瘞", "瘗"}, {"瘧", "疟"}, {"瘮", "瘆"}, {"瘻", "瘘"}, {"療", "疗"}, {"癆", "痨"}, {"癇", "痫"}, {"癉", "瘅"},
        {"癘", "疠"}, {"癟", "瘪"}, {"癡", "痴"}, {"癢", "痒"}, {"癤", "疖"}, {"癩", "癞"}, {"癬", "癣"}, {"癭", "瘿"},
        {"癮", "瘾"}, {"癰", "痈"}, {"癱", "瘫"}, {"癲", "癫"}, {"發", "发"}, {"皚", "皑"}, {"皰", "疱"}, {"皺", "皱"},
        {"盜", "盗"}, {"盞", "盏"}, {"盡", "尽"}, {"監", "监"}, {"盤", "盘"}, {"盧", "卢"}, {"眞", "真"}, {"眥", "眦"},
        {"眾", "众"}, {"睏", "困"}, {"瞘", "眍"}, {"瞞", "瞒"}, {"瞼", "睑"}, {"矇", "蒙"}, {"矚", "瞩"}, {"矯", "矫"},
        {"硜", "硁"}, {"硤", "硖"}, {"硨", "砗"}, {"硯", "砚"}, {"碩", "硕"}, {"碭", "砀"}, {"確", "确"}, {"碼", "码"},
        {"磚", "砖"}, {"磽", "硗"}, {"礎", "础"}, {"礦", "矿"}, {"礪", "砺"}, {"礫", "砾"}, {"礬", "矾"}, {"礱", "砻"},
        {"禍", "祸"}, {"禎", "祯"}, {"禦", "御"}, {"禮", "礼"}, {"禱", "祷"}, {"禿", "秃"}, {"稅", "税"}, {"稈", "秆"},
        {"種", "种"}, {"稱", "称"}, {"穀", "谷"}, {"積", "积"}, {"穡", "穑"}, {"穢", "秽"}, {"穩", "稳"}, {"穫", "获"},
        {"窩", "窝"}, {"窪", "洼"}, {"窮", "穷"}, {"窯", "窑"}, {"窺", "窥"}, {"竄", "窜"}, {"竅", "窍"}, {"竇", "窦"},
        {"竊", "窃"}, {"竪", "竖"}, {"競", "竞"}, {"筆", "笔"}, {"筍", "笋"}, {"箋", "笺"}, {"箏", "筝"}, {"節", "节"},
        {"範", "范"}, {"築", "筑"}, {"篩", "筛"}, {"簡", "简"}, {"簽", "签"}, {"簾", "帘"}, {"籃", "篮"}, {"籌", "筹"},
        {"籠", "笼"}, {"籬", "篱"}, {"籲", "吁"}, {"糝", "糁"}, {"糞", "粪"}, {"糧", "粮"}, {"糲", "粝"}, {"糴", "籴"},
        {"糶", "粜"}, {"糾", "纠"}, {"紀", "纪"}, {"紂", "纣"}, {"約", "约"}, {"紅", "红"}, {"紆", "纡"}, {"紈", "纨"},
        {"紉", "纫"}, {"紋", "纹"}, {"納", "纳"}, {"紐", "纽"}, {"紓", "纾"}, {"純", "纯"}, {"紗", "纱"}, {"紙", "纸"},
        {"級", "级"}, {"紛", "纷"}, {"紜", "纭"}, {"紡", "纺"}, {"紮", "扎"}, {"細", "细"}, {"紳", "绅"}, {"紹", "绍"},
        {"紺", "绀"}, {"終", "终"}, {"組", "组"}, {"絆", "绊"}, {"絎", "绗"}, {"結", "结"}, {"絕", "绝"}, {"絞", "绞"},
        {"絡", "络"}, {"絢", "绚"}, {"給", "给"}, {"絨", "绒"}, {"統", "统"}, {"絲", "丝"}, {"絳", "绛"}, {"綁", "绑"},
        {"綃", "绡"}, {"綏", "绥"}, {"經", "经"}, {"綠", "绿"}, {"綫", "线"}, {"綬", "绶"}, {"維", "维"}, {"綱", "纲"},
        {"網", "网"}, {"綴", "缀"}, {"綵", "彩"}, {"綸", "纶"}, {"綺", "绮"}, {"綽", "绰"}, {"綾", "绫"}, {"綿", "绵"},
        {"緊", "紧"}, {"緋", "绯"}, {"緒", "绪"}, {"緘", "缄"}, {"線", "线"}, {"緝", "缉"}, {"緞", "缎"}, {"締", "缔"},
        {"緣", "缘"}, {"編", "编"}, {"緩", "缓"}, {"緬", "缅"}, {"緯", "纬"}, {"練", "练"}, {"縈", "萦"}, {"縛", "缚"},
        {"縣", "县"}, {"縫", "缝"}, {"縮", "缩"}, {"縱", "纵"}, {"縷", "缕"}, {"總", "总"}, {"績", "绩"}, {"繃", "绷"},
        {"織", "织"}, {"繞", "绕"}, {"繡", "绣"}, {"繩", "绳"}, {"繪", "绘"}, {"繫", "系"}, {"繭", "茧"}, {"繳", "缴"},
        {"繼", "继"}, {"續", "续"}, {"纔", "才"}, {"纖", "纤"}, {"纜", "缆"}, {"缽", "钵"}, {"罰", "罚"}, {"罵", "骂"},
        {"罷", "罢"}, {"羅", "罗"}, {"羈", "羁"}, {"羥", "羟"}, {"義", "义"}, {"習", "习"}, {"翹", "翘"}, {"耬", "耧"},
        {"聖", "圣"}, {"聞", "闻"}, {"聯", "联"}, {"聰", "聪"}, {"聲", "声"}, {"聳", "耸"}, {"聶", "聂"}, {"職", "职"},
        {"聽", "听"}, {"聾", "聋"}, {"肅", "肃"}, {"胷", "胸"}, {"脅", "胁"}, {"脈", "脉"}, {"脛", "胫"}, {"脣", "唇"},
        {"脫", "脱"}, {"脹", "胀"}, {"腎", "肾"}, {"腦", "脑"}, {"腫", "肿"}, {"腳", "脚"}, {"腸", "肠"}, {"膚", "肤"},
        {"膠", "胶"}, {"膩", "腻"}, {"膽", "胆"}, {"膾", "脍"}, {"膿", "脓"}, {"臉", "脸"}, {"臍", "脐"}, {"臘", "腊"},
        {"臚", "胪"}, {"臟", "脏"}, {"臠", "脔"}, {"臨", "临"}, {"臺", "台"}, {"與", "与"}, {"興", "兴"}, {"舉", "举"},
        {"舊", "旧"}, {"舖", "铺"}, {"艙", "舱"}, {"艦", "舰"}, {"艱", "艰"}, {"艷", "艳"}, {"芻", "刍"}, {"茲", "兹"},
        {"莊", "庄"}, {"莖", "茎"}, {"莢", "荚"}, {"華", "华"}, {"萊", "莱"}, {"萬", "万"}, {"葉", "叶"}, {"葷", "荤"},
        {"蒐", "搜"}, {"蒔", "莳"}, {"蒞", "莅"}, {"蓋", "盖"}, {"蓮", "莲"}, {"蓽", "荜"}, {"蔞", "蒌"}, {"蔣", "蒋"},
        {"蔥", "葱"}, {"蔭", "荫"}, {"蕎", "荞"}, {"蕘", "荛"}, {"蕩", "荡"}, {"蕪", "芜"}, {"蕭", "萧"}, {"蕷", "蓣"},
        {"薈", "荟"}, {"薊", "蓟"}, {"薑", "姜"}, {"薦", "荐"}, {"薩", "萨"}, {"薺", "荠"}, {"藍", "蓝"}, {"藝", "艺"},
        {"藥", "药"}, {"蘄", "蕲"}, {"蘆", "芦"}, {"蘇", "苏"}, {"蘊", "蕴"}, {"蘋", "苹"}, {"蘚", "藓"}, {"蘭", "兰"},
        {"蘿", "萝"}, {"處", "处"}, {"虛", "虚"}, {"號", "号"}, {"虧", "亏"}, {"蝟", "猬"}, {"蝦", "虾"}, {"蝸", "蜗"},
        {"螞", "蚂"}, {"螢", "萤"}, {"蟬", "蝉"}, {"蟲", "虫"}, {"蟻", "蚁"}, {"蠅", "蝇"}, {"蠍", "蝎"}, {"蠟", "蜡"},
        {"蠣", "蛎"}, {"蠱", "蛊"}, {"蠶", "蚕"}, {"蠻", "蛮"}, {"衆", "众"}, {"術", "术"}, {"衛", "卫"}, {"衝", "冲"},
        {"衹", "只"}, {"裊", "袅"}, {"裏", "里"}, {"補", "补"}, {"裝", "装"}, {"裡", "里"}, {"複", "复"}, {"褲", "裤"},
        {"褸", "褛"}, {"襖", "袄"}, {"襤", "褴"}, {"襪", "袜"}, {"襯", "衬"}, {"襲", "袭"}, {"見", "见"}, {"規", "规"},
        {"覓", "觅"}, {"視", "视"}, {"覘", "觇"}, {"覡", "觋"}, {"覦", "觎"}, {"親", "亲"}, {"覬", "觊"}, {"覯", "觏"},
        {"覲", "觐"}, {"覷", "觑"}, {"覺", "觉"}, {"覽", "览"}, {"覿", "觌"}, {"觀", "观"}, {"觴", "觞"}, {"觶", "觯"},
        {"觸", "触"}, {"訂", "订"}, {"訃", "讣"}, {"計", "计"}, {"訊", "讯"}, {"訌", "讧"}, {"討", "讨"}, {"訐", "讦"},
        {"訓", "训"}, {"訕", "讪"}, {"訖", "讫"}, {"記", "记"}, {"訛", "讹"}, {"訝", "讶"}, {"訟", "讼"}, {"訣", "诀"},
        {"訥", "讷"}, {"訪", "访"}, {"設", "设"}, {"許", "许"}, {"訴", "诉"}, {"訶", "诃"}, {"診", "诊"}, {"註", "注"},
        {"詁", "诂"}, {"詆", "诋"}, {"詎", "讵"}, {"詐", "诈"}, {"詒", "诒"}, {"評", "评"}, {"詛", "诅"}, {"詞", "词"},
        {"詠", "咏"}, {"詢", "询"}, {"詣", "诣"}, {"試", "试"}, {"詩", "诗"}, {"詬", "诟"}, {"詭", "诡"}, {"詮", "诠"},
        {"詰", "诘"}, {"話", "话"}, {"該", "该"}, {"詳", "详"}, {"詼", "诙"}, {"詿", "诖"}, {"誄", "诔"}, {"誅", "诛"},
        {"誆", "诓"}, {"誇", "夸"}, {"誌", "志"}, {"認", "认"}, {"誑", "诳"}, {"誒", "诶"}, {"誕", "诞"}, {"誘", "诱"},
        {"誚", "诮"}, {"語", "语"}, {"誠", "诚"}, {"誡", "诫"}, {"誣", "诬"}, {"誤", "误"}, {"誥", "诰"}, {"誦", "诵"},
        {"誨", "诲"}, {"說", "说"}, {"誰", "谁"}, {"課", "课"}, {"誹", "诽"}, {"誼", "谊"}, {"調", "调"}, {"諂", "谄"},
        {"諄", "谆"}, {"談", "谈"}, {"諉", "诿"}, {"請", "请"}, {"諍", "诤"}, {"諑", "诼"}, {"諒", "谅"}, {"論", "论"},
        {"諗", "谂"}, {"諛", "谀"}, {"諜", "谍"}, {"諢", "诨"}, {"諤", "谔"}, {"諦", "谛"}, {"諧", "谐"}, {"諫", "谏"},
        {"諭", "谕"}, {"諮", "咨"}, {"諱", "讳"}, {"諳", "谙"}, {"諷", "讽"}, {"諸", "诸"}, {"諺", "谚"}, {"諼", "谖"},
        {"諾", "诺"}, {"謀", "谋"}, {"謁", "谒"}, {"謂", "谓"}, {"謅", "诌"}, {"謊", "谎"}, {"謎", "谜"}, {"謔", "谑"},
        {"謗", "谤"}, {"謙", "谦"}, {"講", "讲"}, {"謝", "谢"}, {"謬", "谬"}, {"謳", "讴"}, {"謹", "谨"}, {"謾", "谩"},
        {"證", "证"}, {"譏", "讥"}, {"識", "识"}, {"譜", "谱"}, {"譯", "译"}, {"議", "议"}, {"護", "护"}, {"讀", "读"},
        {"變", "变"}, {"讒", "谗"}, {"讓", "让"}, {"讚", "赞"}, {"豈", "岂"}, {"豎", "竖"}, {"豐", "丰"}, {"豬", "猪"},
        {"貓", "猫"}, {"貝", "贝"}, {"貞", "贞"}, {"負", "负"}, {"財", "财"}, {"貢", "贡"}, {"貧", "贫"}, {"貨", "货"},
        {"販", "贩"}, {"貪", "贪"}, {"貫", "贯"}, {"責", "责"}, {"貯", "贮"}, {"貲", "赀"}, {"貳", "贰"}, {"貴", "贵"},
        {"貶", "贬"}, {"買", "买"}, {"貸", "贷"}, {"費", "费"}, {"貽", "贻"}, {"貿", "贸"}, {"賀", "贺"}, {"賁", "贲"},
        {"賂", "赂"}, {"賃", "赁"}, {"賄", "贿"}, {"賅", "赅"}, {"資", "资"}, {"賈", "贾"}, {"賊", "贼"}, {"賑", "赈"},
        {"賒", "赊"}, {"賓", "宾"}, {"賜", "赐"}, {"賞", "赏"}, {"賠", "赔"}, {"賢", "贤"}, {"賣", "卖"}, {"賤", "贱"},
        {"賦", "赋"}, {"質", "质"}, {"賬", "账"}, {"賭", "赌"}, {"賴", "赖"}, {"賸", "剩"}, {"賺", "赚"}, {"賻", "赙"},
        {"購", "购"}, {"賽", "赛"}, {"贄", "贽"}, {"贈", "赠"}, {"贊", "赞"}, {"贍", "赡"}, {"贏", "赢"}, {"贐", "赆"},
        {"贖", "赎"}, {"贛", "赣"}, {"趕", "赶"}, {"趙", "赵"}, {"趨", "趋"}, {"蹌", "跄"}, {"蹣", "蹒"}, {"蹤", "踪"},
        {"躉", "趸"}, {"躊", "踌"}, {"躋", "跻"}, {"躍", "跃"}, {"躑", "踯"}, {"躚", "跹"}, {"躡", "蹑"}, {"躥", "蹿"},
        {"躪", "躏"}, {"軀", "躯"}, {"車", "车"}, {"軋", "轧"}, {"軌", "轨"}, {"軍", "军"}, {"軒", "轩"}, {"軔", "轫"},
        {"軟", "软"}, {"軲", "轱"}, {"軸", "轴"}, {"軻", "轲"}, {"軼", "轶"}, {"較", "较"}, {"輅", "辂"}, {"載", "载"},
        {"輊", "轾"}, {"輒", "辄"}, {"輔", "辅"}, {"輕", "轻"}, {"輛", "辆"}, {"輝", "辉"}, {"輟", "辍"}, {"輥", "辊"},
        {"輦", "辇"}, {"輩", "辈"}, {"輪", "轮"}, {"輯", "辑"}, {"輸", "输"}, {"輾", "辗"}, {"輿", "舆"}, {"轂", "毂"},
        {"轄", "辖"}, {"轅", "辕"}, {"轆", "辘"}, {"轉", "转"}, {"轍", "辙"}, {"轎", "轿"}, {"轟", "轰"}, {"辦", "办"},
        {"辭", "辞"}, {"辯", "辩"}, {"農", "农"}, {"迴", "回"}, {"逕", "迳"}, {"這", "这"}, {"連", "连"}, {"週", "周"},
        {"進", "进"}, {"遊", "游"}, {"運", "运"}, {"過", "过"}, {"達", "达"}, {"違", "违"}, {"遙", "遥"}, {"遜", "逊"},
        {"遞", "递"}, {"遠", "远"}, {"適", "适"}, {"遲", "迟"}, {"遷", "迁"}, {"選", "选"}, {"遺", "遗"}, {"遼", "辽"},
        {"邁", "迈"}, {"還", "还"}, {"邇", "迩"}, {"邊", "边"}, {"邏", "逻"}, {"郵", "邮"}, {"鄉", "乡"}, {"鄒", "邹"},
        {"鄔", "邬"}, {"鄧", "邓"}, {"鄭", "郑"}, {"鄰", "邻"}, {"鄲", "郸"}, {"鄴", "邺"}, {"鄶", "郐"}, {"鄺", "邝"},
        {"醃", "腌"}, {"醜", "丑"}, {"醞", "酝"}, {"醫", "医"}, {"醬", "酱"}, {"釀", "酿"}, {"釁", "衅"}, {"釋", "释"},
        {"釘", "钉"}, {"針", "针"}, {"釣", "钓"}, {"釦", "扣"}, {"鈍", "钝"}, {"鈔", "钞"}, {"鈕", "钮"}, {"鈴", "铃"},
        {"鉛", "铅"}, {"鉤", "钩"}, {"銀", "银"}, {"銅", "铜"}, {"銜", "衔"}, {"銳", "锐"}, {"銷", "销"}, {"鋁", "铝"},
        {"鋒", "锋"}, {"鋤", "锄"}, {"鋪", "铺"}, {"鋸", "锯"}, {"鋼", "钢"}, {"錄", "录"}, {"錘", "锤"}, {"錢", "钱"},
        {"錦", "锦"}, {"錨", "锚"}, {"錯", "错"}, {"錶", "表"}, {"鍋", "锅"}, {"鍍", "镀"}, {"鍛", "锻"}, {"鍵", "键"},
        {"鍾", "钟"}, {"鎖", "锁"}, {"鎮", "镇"}, {"鏈", "链"}, {"鏟", "铲"}, {"鏡", "镜"}, {"鏢", "镖"}, {"鏽", "锈"},
        {"鐘", "钟"}, {"鐮", "镰"}, {"鐳", "镭"}, {"鐵", "铁"}, {"鐺", "铛"}, {"鑄", "铸"}, {"鑒", "鉴"}, {"鑰", "钥"},
        {"鑽", "钻"}, {"鑾", "銮"}, {"鑿", "凿"}, {"長", "长"}, {"門", "门"}, {"閂", "闩"}, {"閃", "闪"}, {"閉", "闭"},
        {"開", "开"}, {"閏", "闰"}, {"閑", "闲"}, {"間", "间"}, {"閔", "闵"}, {"閘", "闸"}, {"閡", "阂"}, {"閣", "阁"},
        {"閥", "阀"}, {"閨", "闺"}, {"閱", "阅"}, {"闆", "板"}, {"闊", "阔"}, {"闔", "阖"}, {"闖", "闯"}, {"關", "关"},
        {"闡", "阐"}, {"闢", "辟"}, {"陝", "陕"}, {"陣", "阵"}, {"陰", "阴"}, {"陳", "陈"}, {"陸", "陆"}, {"陽", "阳"},
        {"隊", "队"}, {"階", "阶"}, {"際", "际"}, {"隨", "随"}, {"險", "险"}, {"隱", "隐"}, {"隴", "陇"}, {"隸", "隶"},
        {"隻", "只"}, {"雋", "隽"}, {"雖", "虽"}, {"雙", "双"}, {"雛", "雏"}, {"雜", "杂"}, {"雞", "鸡"}, {"離", "离"},
        {"難", "难"}, {"雲", "云"}, {"電", "电"}, {"霧", "雾"}, {"霽", "霁"}, {"靂", "雳"}, {"靄", "霭"}, {"靈", "灵"},
        {"靜", "静"}, {"靨", "靥"}, {"鞏", "巩"}, {"鞽", "鞒"}, {"韁", "缰"}, {"韉", "鞯"}, {"韋", "韦"}, {"韌", "韧"},
        {"韓", "韩"}, {"韻", "韵"}, {"響", "响"}, {"頁", "页"}, {"頂", "顶"}, {"頃", "顷"}, {"項", "项"}, {"順", "顺"},
        {"須", "须"}, {"頌", "颂"}, {"預", "预"}, {"頑", "顽"}, {"頒", "颁"}, {"頓", "顿"}, {"頗", "颇"}, {"領", "领"},
        {"頭", "头"}, {"頸", "颈"}, {"頻", "频"}, {"顆", "颗"}, {"題", "题"}, {"額", "额"}, {"顏", "颜"}, {"願", "愿"},
        {"顛", "颠"}, {"類", "类"}, {"顧", "顾"}, {"顫", "颤"}, {"顯", "显"}, {"風", "风"}, {"颱", "台"}, {"颳", "刮"},
        {"颶", "飓"}, {"颺", "扬"}, {"飄", "飘"}, {"飛", "飞"}, {"飯", "饭"}, {"飲", "饮"}, {"飼", "饲"}, {"飽", "饱"},
        {"飾", "饰"}, {"餃", "饺"}, {"餅", "饼"}, {"養", "养"}, {"餌", "饵"}, {"餓", "饿"}, {"餘", "余"}, {"館", "馆"},
        {"饅", "馒"}, {"饑", "饥"}, {"饒", "饶"}, {"馬", "马"}, {"馭", "驭"}, {"馮", "冯"}, {"馱", "驮"}, {"馳", "驰"},
        {"駁", "驳"}, {"駐", "驻"}, {"駕", "驾"}, {"駛", "驶"}, {"駝", "驼"}, {"騎", "骑"}, {"騙", "骗"}, {"騰", "腾"},
        {"驀", "蓦"}, {"驅", "驱"}, {"驕", "骄"}, {"驗", "验"}, {"驚", "惊"}, {"驛", "驿"}, {"驟", "骤"}, {"驢", "驴"},
        {"髒", "脏"}, {"體", "体"}, {"髮", "发"}, {"鬆", "松"}, {"鬍", "胡"}, {"鬚", "须"}, {"鬥", "斗"}, {"鬧", "闹"},
        {"鬨", "哄"}, {"鬱", "郁"}, {"魚", "鱼"}, {"魯", "鲁"}, {"鮮", "鲜"}, {"鯉", "鲤"}, {"鯨", "鲸"}, {"鰻", "鳗"},
        {"鱷", "鳄"}, {"鳥", "鸟"}, {"鳳", "凤"}, {"鳴", "鸣"}, {"鴨", "鸭"}, {"鴿", "鸽"}, {"鵝", "鹅"}, {"鵲", "鹊"},
        {"鶯", "莺"}, {"鶴", "鹤"}, {"鷹", "鹰"}, {"鸚", "鹦"}, {"鹵", "卤"}, {"鹼", "碱"}, {"鹽", "盐"}, {"麗", "丽"},
        {"麥", "麦"}, {"麪", "面"}, {"麵", "面"}, {"麼", "么"}, {"黃", "黄"}, {"點", "点"}, {"黨", "党"}, {"黴", "霉"},
        {"齊", "齐"}, {"齋", "斋"}, {"齎", "赍"}, {"齒", "齿"}, {"齧", "啮"}, {"龍", "龙"}, {"龐", "庞"}, {"龜", "龟"},
    };
    return pairs;
}

} // namespace whisperim::domain
